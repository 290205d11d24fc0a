#include "config_parser.hpp"
#include "config_parser_utils.hpp"

#include <doctest.h>

#include <string>

using namespace mender;

TEST_CASE("config_parser") {
    ParseResult result;
    Value root;

    SUBCASE("sections_and_scalars") {
        std::string input = R"foo(
top = 'level'

[general]
strict = true
fuzzy_threshold = 0.87
fuzzy_scan_lines = 400
negative = -3
name = "double quoted"
)foo";
        REQUIRE(cfg_parse_value_tree(input, result, root));
        REQUIRE(result.is_ok());

        REQUIRE(root["top"].as_string() == "level");

        auto strict = root.lookup_value_by_path("general.strict");
        REQUIRE(strict);
        REQUIRE(strict->get().is_bool());
        REQUIRE(strict->get().as_bool());

        REQUIRE(root["general"]["fuzzy_threshold"].as_float() == doctest::Approx(0.87));
        REQUIRE(root["general"]["fuzzy_scan_lines"].as_int() == 400);
        REQUIRE(root["general"]["negative"].as_int() == -3);
        REQUIRE(root["general"]["name"].as_string() == "double quoted");

        REQUIRE_FALSE(root.lookup_value_by_path("general.missing"));
        REQUIRE_FALSE(root.lookup_value_by_path("missing.strict"));
    }

    SUBCASE("insertion_order") {
        REQUIRE(cfg_parse_value_tree("[b]\nz = 1\na = 2\n[a]\n", result, root));
        auto it = root.as_table().begin();
        REQUIRE(it->first == "b");
        REQUIRE((++it)->first == "a");

        auto& b = root["b"].as_table();
        REQUIRE(b.begin()->first == "z");
    }

    SUBCASE("arrays") {
        REQUIRE(cfg_parse_value_tree("[general]\nstrategies = ['exact', \"fuzzy\",]\nempty = []\nnested = [[1, 2], [3]]\n",
                                     result, root));
        auto& strategies = root["general"]["strategies"].as_array();
        REQUIRE(strategies.size() == 2);
        REQUIRE(strategies[0].as_string() == "exact");
        REQUIRE(strategies[1].as_string() == "fuzzy");
        REQUIRE(root["general"]["empty"].as_array().empty());
        REQUIRE(root["general"]["nested"].as_array()[0].as_array()[1].as_int() == 2);
    }

    SUBCASE("comments") {
        std::string input = "# heading\n[general]\n# about strict\nstrict = false # trailing\nname = 'a # b'\n";
        REQUIRE(cfg_parse_value_tree(input, result, root));
        REQUIRE(root["general"].key_comments.size() == 1);
        REQUIRE(root["general"].key_comments[0] == "# heading");
        REQUIRE(root["general"]["strict"].key_comments[0] == "# about strict");
        REQUIRE_FALSE(root["general"]["strict"].as_bool());
        REQUIRE(root["general"]["name"].as_string() == "a # b");
    }

    SUBCASE("escapes") {
        REQUIRE(cfg_parse_value_tree("a = \"x\\ty\\n\\\"z\\\"\"\nb = 'c:\\dir'\n", result, root));
        REQUIRE(root["a"].as_string() == "x\ty\n\"z\"");
        REQUIRE(root["b"].as_string() == "c:\\dir");
    }

    SUBCASE("crlf") {
        REQUIRE(cfg_parse_value_tree("[general]\r\nstrict = true\r\n", result, root));
        REQUIRE(root["general"]["strict"].as_bool());
    }

    SUBCASE("errors_carry_the_line") {
        REQUIRE_FALSE(cfg_parse_value_tree("[general]\nstrict = yes\n", result, root));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        REQUIRE(result.line == 2);
        REQUIRE(result.error.find("line 2") == 0);

        REQUIRE_FALSE(cfg_parse_value_tree("[general\n", result, root));
        REQUIRE(result.line == 1);

        REQUIRE_FALSE(cfg_parse_value_tree("\n\njust words\n", result, root));
        REQUIRE(result.line == 3);

        REQUIRE_FALSE(cfg_parse_value_tree("a = 'open\n", result, root));
        REQUIRE_FALSE(cfg_parse_value_tree("a = [1, 2\n", result, root));
        REQUIRE_FALSE(cfg_parse_value_tree("a = 1 2\n", result, root));
        REQUIRE_FALSE(cfg_parse_value_tree("a = 1.2.3\n", result, root));
        REQUIRE_FALSE(cfg_parse_value_tree("a = \n", result, root));
        REQUIRE_FALSE(cfg_parse_value_tree("a = 1\na = 2\n", result, root));
        REQUIRE_FALSE(cfg_parse_value_tree("[s]\n[s]\n", result, root));
        REQUIRE_FALSE(cfg_parse_value_tree("bad key = 1\n", result, root));
    }

    SUBCASE("empty_document") {
        REQUIRE(cfg_parse_value_tree("", result, root));
        REQUIRE(root.is_table());
        REQUIRE(root.as_table().empty());
    }

    SUBCASE("single_value") {
        Value value;
        REQUIRE(cfg_parse_value("[1, 2.5, true, 'x']", result, value));
        REQUIRE(value.as_array().size() == 4);
        REQUIRE(value.as_array()[1].as_float() == 2.5);
        REQUIRE_FALSE(cfg_parse_value("1 trailing", result, value));
    }
}

TEST_CASE("config_value_paths") {
    Value root{Value::Table{}};

    REQUIRE(root.set_value_at("general.strict", Value{Value::Bool{true}}));
    REQUIRE(root.set_value_at("general.fuzzy_threshold", Value{Value::Float{0.8}}));
    REQUIRE(root["general"]["strict"].as_bool());

    // Overwrite keeps the key where it was.
    REQUIRE(root.set_value_at("general.strict", Value{Value::Bool{false}}));
    REQUIRE(root["general"].as_table().begin()->first == "strict");
    REQUIRE_FALSE(root["general"]["strict"].as_bool());

    // Can't descend into a scalar.
    REQUIRE_FALSE(root.set_value_at("general.strict.deeper", Value{Value::Int{1}}));
    REQUIRE_FALSE(root.set_value_at("", Value{Value::Int{1}}));
}

TEST_CASE("config_serializer") {
    Value root{Value::Table{}};
    root.set_value_at("version", Value{Value::Int{1}});
    root.set_value_at("general.strict", Value{Value::Bool{false}});
    root.set_value_at("general.fuzzy_threshold", Value{Value::Float{1.0}});
    root.set_value_at("general.name", Value{Value::String{"it's"}});

    Value strategies{Value::Array{Value{Value::String{"exact"}}, Value{Value::String{"fuzzy"}}}};
    root.set_value_at("general.strategies", strategies);
    root["general"].key_comments.push_back("# General settings\n#\n");

    auto text = cfg_serialize(root);
    REQUIRE(text ==
            "version = 1\n"
            "\n"
            "# General settings\n"
            "#\n"
            "[general]\n"
            "strict = false\n"
            "fuzzy_threshold = 1.0\n"
            "name = \"it's\"\n"
            "strategies = ['exact', 'fuzzy']\n");

    // What we write, we can read back.
    ParseResult result;
    Value parsed;
    REQUIRE(cfg_parse_value_tree(text, result, parsed));
    REQUIRE(parsed["general"]["fuzzy_threshold"].is_float());
    REQUIRE(parsed["general"]["name"].as_string() == "it's");
    REQUIRE(parsed["general"]["strategies"].as_array().size() == 2);
    REQUIRE(parsed["general"].key_comments.size() == 2);
}

TEST_CASE("config_load_file") {
    ParseResult result;
    Value root;
    REQUIRE_FALSE(cfg_load_file("/nonexistent/mender/mender.conf", result, root));
    REQUIRE(result.kind == ParseErrorKind::File);
}
