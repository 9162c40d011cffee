#pragma once

/*
===============================================================================
twinkit: Public API Entry Point
===============================================================================

Byte/text codecs, national identifier checksums, time-ordered and stable
identifiers, nested structure transforms and password/token helpers.

Codec, checksum and identifier calls are served by either the native or the
fallback kernels; the choice is made once per process (TWINKIT_BACKEND) and
both produce identical results.
===============================================================================
*/

#include <twinkit/version.hpp>
#include <twinkit/error.hpp>
#include <twinkit/types.hpp>
#include <twinkit/codec.hpp>
#include <twinkit/checksum.hpp>
#include <twinkit/identifier.hpp>
#include <twinkit/structure/value.hpp>
#include <twinkit/structure/transform.hpp>
#include <twinkit/structure/json.hpp>
#include <twinkit/crypto/digest.hpp>
#include <twinkit/crypto/password.hpp>
#include <twinkit/crypto/token.hpp>
#include <twinkit/dispatch/dispatcher.hpp>
