#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "clawlink/common/fs.hpp"
#include "clawlink/common/json.hpp"
#include "clawlink/common/toml.hpp"
#include "clawlink/common/uuid.hpp"

#include <sys/stat.h>

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <set>

void register_common_tests(std::vector<clawlink::tests::TestCase> &tests) {
  using clawlink::tests::require;
  namespace common = clawlink::common;

  tests.push_back({"json_parses_nested_documents", [] {
                     const auto parsed = common::parse_json(
                         R"({"id":"r1","result":{"ok":true,"items":[1,2.5,-3e2,null]},"error":null})");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &value = parsed.value();
                     require(value.string_field("id") == "r1", "string field");
                     const auto *result = value.find("result");
                     require(result != nullptr && result->bool_field("ok") == true, "bool field");
                     const auto *items = result->find("items")->as_array();
                     require(items != nullptr && items->size() == 4, "array size");
                     require((*items)[1].as_number() == 2.5, "fraction");
                     require((*items)[2].as_int() == -300, "exponent");
                     require((*items)[3].is_null(), "null item");
                     require(value.find("error")->is_null(), "explicit null member");
                     require(value.find("missing") == nullptr, "missing member");
                     require(!value.string_field("result").has_value(), "type mismatch is nullopt");
                   }});

  tests.push_back({"json_decodes_escapes", [] {
                     const auto parsed = common::parse_json(R"("line\n\"q\" \u00e9 \ud83d\ude00")");
                     require(parsed.ok(), "escaped string should parse");
                     require(parsed.value().as_string() == "line\n\"q\" \xc3\xa9 \xf0\x9f\x98\x80",
                             "escapes should decode to utf-8");
                     require(!common::parse_json(R"("\ud83d")").ok(), "unpaired surrogate rejected");
                   }});

  tests.push_back({"json_rejects_malformed_input", [] {
                     require(!common::parse_json("").ok(), "empty");
                     require(!common::parse_json("{\"a\":1,}").ok(), "trailing comma");
                     require(!common::parse_json("{\"a\" 1}").ok(), "missing colon");
                     require(!common::parse_json("[1,2] x").ok(), "trailing characters");
                     require(!common::parse_json("\"open").ok(), "unterminated string");
                     require(!common::parse_json("not json at all").ok(), "bare words");
                   }});

  tests.push_back({"json_int_rejects_values_outside_int64", [] {
                     const auto parsed = common::parse_json(
                         R"({"big":9223372036854775808,"low":-9223372036854775808,)"
                         R"("under":-9223372036854777856,"ts":1700000000000})");
                     require(parsed.ok(), "document should parse");
                     const auto &value = parsed.value();
                     require(!value.int_field("big").has_value(), "2^63 does not fit in int64");
                     require(value.int_field("low") == std::numeric_limits<std::int64_t>::min(),
                             "-2^63 is the smallest int64");
                     require(!value.int_field("under").has_value(), "below -2^63 is rejected");
                     require(value.int_field("ts") == 1700000000000, "millisecond timestamps fit");
                   }});

  tests.push_back({"json_dump_is_stable", [] {
                     auto value = common::JsonValue::object({
                         {"method", "chat.send"},
                         {"params", common::JsonValue::object({{"limit", 10}, {"text", "a\"b"}})},
                         {"id", "x"},
                     });
                     value.set("extra", common::JsonValue::array({true, nullptr, 1.5}));
                     const std::string dumped = value.dump();
                     require(dumped == R"({"extra":[true,null,1.5],"id":"x","method":"chat.send",)"
                                       R"("params":{"limit":10,"text":"a\"b"}})",
                             "unexpected dump: " + dumped);
                     const auto reparsed = common::parse_json(dumped);
                     require(reparsed.ok() && reparsed.value() == value, "dump should reparse");
                     require(common::json_escape("tab\there") == "tab\\there", "escape helper");
                   }});

  tests.push_back({"toml_reads_sections_and_types", [] {
                     const auto parsed = common::parse_toml(R"(
# comment line
top = "level"

[gateway]
url = "wss://host/#fragment"  # trailing comment
tls_verify = false
request_timeout_secs = 1_000
identity_db = 'C:\literal\path'
)");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("top").value() == "level", "top-level key");
                     require(doc.get_string("gateway.url").value() == "wss://host/#fragment",
                             "hash inside quotes is not a comment");
                     require(!doc.get_bool("gateway.tls_verify", true).value(), "bool parsing");
                     require(doc.get_u64("gateway.request_timeout_secs", 0).value() == 1000,
                             "integer parsing with separators");
                     require(doc.get_string("gateway.identity_db").value() == "C:\\literal\\path",
                             "literal strings keep backslashes");
                     require(doc.get_string("gateway.absent", "fb").value() == "fb",
                             "missing key fallback");
                     require(doc.has("gateway.url") && !doc.has("url"), "keys are table scoped");
                     require(doc.keys().size() == 5, "five keys");
                   }});

  tests.push_back({"toml_getters_check_types", [] {
                     const auto parsed = common::parse_toml("[pairing]\nmax_poll_attempts = \"ten\"\n");
                     require(parsed.ok(), "document should parse");
                     const auto wrong = parsed.value().get_u64("pairing.max_poll_attempts", 150);
                     require(!wrong.ok(), "string is not an integer");
                     require(wrong.error().find("line 2") != std::string::npos,
                             "error should name the line: " + wrong.error());
                     require(!parsed.value().get_bool("pairing.max_poll_attempts", false).ok(),
                             "string is not a bool");
                   }});

  tests.push_back({"toml_rejects_malformed_documents", [] {
                     require(!common::parse_toml("[]\n").ok(), "empty table rejected");
                     require(!common::parse_toml("[gateway\n").ok(), "unclosed table rejected");
                     require(!common::parse_toml("just words\n").ok(), "missing equals rejected");
                     require(!common::parse_toml("a = 1\na = 2\n").ok(), "duplicate key rejected");
                     require(!common::parse_toml("a = 12abc\n").ok(), "bad integer rejected");
                     require(!common::parse_toml("a = -1\n").ok(), "negative integer rejected");
                     require(!common::parse_toml("a = \"open\n").ok(), "unterminated string");
                     require(!common::parse_toml("a = \"x\" y\n").ok(), "text after string");
                     require(!common::parse_toml("bad key = 1\n").ok(), "spaces in key");
                     const auto error = common::parse_toml("ok = 1\n\nbroken\n");
                     require(!error.ok() && error.error().rfind("line 3:", 0) == 0,
                             "error should lead with the line number");
                   }});

  tests.push_back({"toml_quoting_round_trips", [] {
                     const std::string tricky = "say \"hi\" \\ there\n\tnext # not a comment";
                     const auto parsed = common::parse_toml("name = " + common::quote_toml_string(tricky));
                     require(parsed.ok() && parsed.value().get_string("name").value() == tricky,
                             "quoted value should round trip");
                   }});

  tests.push_back({"fs_expands_home_and_variables", [] {
                     const char *previous = std::getenv("HOME");
                     const std::string saved = previous == nullptr ? "" : previous;
                     setenv("HOME", "/home/tester", 1);
                     setenv("CLAWLINK_TEST_DIR", "data", 1);
                     unsetenv("CLAWLINK_TEST_UNSET");

                     const auto home = common::expand_path("~/.clawlink/identity.db");
                     const auto braces = common::expand_path("/srv/${CLAWLINK_TEST_DIR}/x");
                     const auto bare = common::expand_path("$CLAWLINK_TEST_DIR/y");
                     const auto unset = common::expand_path("/a/$CLAWLINK_TEST_UNSET/b");
                     const auto literal = common::expand_path("cost$5 ~user ${");

                     if (previous == nullptr) {
                       unsetenv("HOME");
                     } else {
                       setenv("HOME", saved.c_str(), 1);
                     }
                     unsetenv("CLAWLINK_TEST_DIR");

                     require(home == "/home/tester/.clawlink/identity.db", "tilde: " + home);
                     require(braces == "/srv/data/x", "braced variable: " + braces);
                     require(bare == "data/y", "bare variable: " + bare);
                     require(unset == "/a//b", "unset variable expands to nothing: " + unset);
                     require(literal == "cost$5 ~user ${", "non-references are kept: " + literal);
                   }});

  tests.push_back({"fs_atomic_write_replaces_contents", [] {
                     clawlink::testing::TempDir dir;
                     const auto path = dir.path() / "state.bin";
                     require(common::write_file_atomic(path, "first", 0600).ok(), "first write");
                     require(common::write_file_atomic(path, std::string("sec\0nd", 6), 0600).ok(),
                             "second write");
                     const auto contents = common::read_file(path);
                     require(contents.ok() && contents.value() == std::string("sec\0nd", 6),
                             "binary contents should round trip");
                     struct stat info {};
                     require(::stat(path.c_str(), &info) == 0 && (info.st_mode & 0777) == 0600,
                             "mode should be applied");
                     require(!std::filesystem::exists(path.string() + ".tmp"), "temp file renamed");
                     require(!common::read_file(dir.path() / "missing").ok(), "missing file fails");
                     require(!common::write_file_atomic(dir.path() / "no" / "dir" / "f", "x", 0600).ok(),
                             "missing parent directory fails");
                   }});

  tests.push_back({"fs_trim_and_lower", [] {
                     require(common::trim("  \t value \r\n") == "value", "trim");
                     require(common::trim(" \n ").empty(), "all whitespace");
                     require(common::to_lower("WSS://Host") == "wss://host", "lower");
                   }});

  tests.push_back({"uuid_is_random_v4", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 64; ++i) {
                       const auto id = common::generate_uuid();
                       require(id.size() == 36, "canonical length");
                       require(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-',
                               "dash positions");
                       require(id[14] == '4', "version nibble");
                       require(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b',
                               "variant bits");
                       seen.insert(id);
                     }
                     require(seen.size() == 64, "identifiers should not repeat");

                     const auto hex = common::random_hex(4);
                     require(hex.size() == 8, "two characters per byte");
                     for (const char ch : hex) {
                       require(std::isxdigit(static_cast<unsigned char>(ch)) != 0 &&
                                   std::tolower(static_cast<unsigned char>(ch)) == ch,
                               "lower-case hex");
                     }
                   }});
}
