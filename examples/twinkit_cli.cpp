#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "twinkit.hpp"

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

using namespace twinkit;

/*
===============================================================================
twinkit command line
===============================================================================

Small front end over the library, one subcommand per operation:

  hex <text>               unhex <hex>
  b64 <text>               unb64 <base64>
  uuid [-n N]              uuid-time <uuid>
  stable-uuid <part>...    national-id <digits>
  sort-json <json>         backend

Exit status is 0 on success, 1 when the operation reports an error (or the
national identifier is invalid).
===============================================================================
*/

namespace {

int report(Error err, std::string_view what) {
    std::cerr << what << ": " << to_string(err) << std::endl;
    return EXIT_FAILURE;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"twinkit: codecs, checksums, identifiers and structure tools"};
    app.require_subcommand(1);

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level: trace | debug | info | warn | error | off")
        ->check(examples::cli::log_level_validator)
        ->default_val(log_level);

    int status = EXIT_SUCCESS;

    // ---------------------------------------------------------------------
    // Codecs
    // ---------------------------------------------------------------------
    std::string hex_input;
    auto* hex = app.add_subcommand("hex", "Hex encode the UTF-8 bytes of TEXT");
    hex->add_option("text", hex_input, "Input text")->required();
    hex->callback([&] {
        std::cout << codec::hex_encode(std::string_view(hex_input)) << std::endl;
    });

    std::string unhex_input;
    auto* unhex = app.add_subcommand("unhex", "Decode HEX and print the bytes");
    unhex->add_option("hex", unhex_input, "Hex digits")->required()->check(examples::cli::hex_validator);
    unhex->callback([&] {
        Bytes out;
        const Error err = codec::hex_decode(unhex_input, out);
        if (err != Error::None) {
            status = report(err, "unhex");
            return;
        }
        std::cout << as_text(out) << std::endl;
    });

    std::string b64_input;
    auto* b64 = app.add_subcommand("b64", "Base64 encode the UTF-8 bytes of TEXT");
    b64->add_option("text", b64_input, "Input text")->required();
    b64->callback([&] {
        std::cout << codec::base64_encode(std::string_view(b64_input)) << std::endl;
    });

    std::string unb64_input;
    auto* unb64 = app.add_subcommand("unb64", "Strictly decode BASE64 and print the bytes");
    unb64->add_option("base64", unb64_input, "Padded base64 text")->required();
    unb64->callback([&] {
        Bytes out;
        const Error err = codec::base64_decode(unb64_input, out);
        if (err != Error::None) {
            status = report(err, "unb64");
            return;
        }
        std::cout << as_text(out) << std::endl;
    });

    // ---------------------------------------------------------------------
    // Identifiers
    // ---------------------------------------------------------------------
    int uuid_count = 1;
    auto* uuid = app.add_subcommand("uuid", "Generate time-ordered (v7) identifiers");
    uuid->add_option("-n,--count", uuid_count, "How many to generate")
        ->check(CLI::Range(1, 100000))
        ->default_val(uuid_count);
    uuid->callback([&] {
        for (int i = 0; i < uuid_count; ++i) {
            std::string id;
            const Error err = identifier::uuidv7(id);
            if (err != Error::None) {
                status = report(err, "uuid");
                return;
            }
            std::cout << id << '\n';
        }
        std::cout.flush();
    });

    std::string uuid_time_input;
    auto* uuid_time = app.add_subcommand("uuid-time", "Print the creation time of a v7 identifier");
    uuid_time->add_option("uuid", uuid_time_input, "Identifier (dashes optional)")->required();
    uuid_time->callback([&] {
        std::optional<Timestamp> ts;
        const Error err = identifier::uuidv7_to_timestamp(uuid_time_input, ts);
        if (err != Error::None) {
            status = report(err, "uuid-time");
            return;
        }
        std::cout << (ts ? twinkit::to_string(*ts) : std::string("(none)")) << std::endl;
    });

    std::vector<std::string> stable_parts;
    auto* stable = app.add_subcommand("stable-uuid", "Deterministic identifier of the given parts");
    stable->add_option("parts", stable_parts, "Ordered parts");
    stable->callback([&] {
        std::string id;
        const Error err = identifier::stable_uuid(stable_parts, id);
        if (err != Error::None) {
            status = report(err, "stable-uuid");
            return;
        }
        std::cout << id << std::endl;
    });

    std::string national_id;
    auto* nid = app.add_subcommand("national-id", "Validate a national identifier checksum");
    nid->add_option("id", national_id, "Up to 9 digits")->required()->check(examples::cli::digits_validator);
    nid->callback([&] {
        const bool valid = checksum::is_valid_national_id(national_id);
        std::cout << (valid ? "valid" : "invalid") << std::endl;
        if (!valid) {
            status = EXIT_FAILURE;
        }
    });

    // ---------------------------------------------------------------------
    // Structure
    // ---------------------------------------------------------------------
    std::string json_input;
    auto* sort_json = app.add_subcommand("sort-json", "Sort the keys of a JSON document recursively");
    sort_json->add_option("json", json_input, "JSON text")->required();
    sort_json->callback([&] {
        structure::Value parsed;
        Error err = structure::from_json(json_input, parsed);
        if (err != Error::None) {
            status = report(err, "sort-json (parse)");
            return;
        }
        structure::Value sorted;
        err = structure::sort_keys_recursively(parsed, sorted);
        if (err != Error::None) {
            status = report(err, "sort-json");
            return;
        }
        std::string out;
        err = structure::to_json(sorted, out);
        if (err != Error::None) {
            status = report(err, "sort-json (write)");
            return;
        }
        std::cout << out << std::endl;
    });

    // ---------------------------------------------------------------------
    // Diagnostics
    // ---------------------------------------------------------------------
    auto* backend = app.add_subcommand("backend", "Show which kernels serve each operation family");
    backend->callback([&] {
        const auto& s = dispatch::selection();
        std::cout << "version    : " << TWINKIT_VERSION_STRING << "\n"
                  << "policy     : " << policy::to_string(s.policy) << "\n"
                  << "native     : " << (dispatch::native_compiled() ? "compiled" : "not compiled") << "\n"
                  << "codec      : " << dispatch::to_string(s.codec) << "\n"
                  << "checksum   : " << dispatch::to_string(s.checksum) << "\n"
                  << "identifier : " << dispatch::to_string(s.identifier) << "\n"
                  << "cpu        : " << s.cpu << std::endl;
    });

    // Log level must be applied before any subcommand callback runs
    app.parse_complete_callback([&] { examples::set_log_level(log_level); });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, std::cout, std::cerr);
    }

    return status;
}
