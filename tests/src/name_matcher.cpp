#include <gtest/gtest.h>
#include <optbind/optbind.hpp>

using namespace optbind;
using optbind::detail::name_matcher;
using optbind::detail::token_class;

using string_list = std::vector<std::string>;

class NameMatcherTest : public ::testing::Test {
protected:
    parser p;

    void SetUp() override {
        p.add_option<std::string>("outputFile").set_names(name_specification::long_and_short());
        p.add_flag("verbose").set_names({ name_element::long_name(), name_element::custom_short('v') });
        p.add_flag("x").set_names({ name_element::short_name() });
        p.add_option<int>("level");
    }
};

// 1. kebab case
TEST(KebabCaseTest, Conversions) {
    EXPECT_EQ(detail::to_kebab_case("outputFile"), "output-file");
    EXPECT_EQ(detail::to_kebab_case("output_file"), "output-file");
    EXPECT_EQ(detail::to_kebab_case("OutputFile"), "output-file");
    EXPECT_EQ(detail::to_kebab_case("URLPath"), "url-path");
    EXPECT_EQ(detail::to_kebab_case("level2Cache"), "level2-cache");
    EXPECT_EQ(detail::to_kebab_case("plain"), "plain");
}

// 2. numbers
TEST(LooksLikeNumberTest, Numbers) {
    EXPECT_TRUE(detail::looks_like_number("-5"));
    EXPECT_TRUE(detail::looks_like_number("-1.5e3"));
    EXPECT_TRUE(detail::looks_like_number("+2"));
    EXPECT_FALSE(detail::looks_like_number("-"));
    EXPECT_FALSE(detail::looks_like_number("-x"));
    EXPECT_FALSE(detail::looks_like_number("-1e"));
}

// 3. spellings
TEST_F(NameMatcherTest, Spellings) {
    EXPECT_EQ(p.find_definition("outputFile")->names, (string_list{"--output-file", "-o"}));
    EXPECT_EQ(p.find_definition("verbose")->names, (string_list{"--verbose", "-v"}));
    EXPECT_EQ(p.find_definition("x")->names, (string_list{"-x"}));
    EXPECT_EQ(p.find_definition("level")->names, (string_list{"--level"}));
}

// 4. custom names
TEST(NameSpecificationTest, CustomNames) {
    parse_config cfg;
    name_specification naming{ name_element::custom_long("verbose", true), name_element::custom_short("é"), name_element::custom_long("loud") };
    EXPECT_EQ(naming.make_names("anything", cfg), (string_list{"-verbose", "-é", "--loud"}));

    EXPECT_THROW(name_element::custom_short("ab"), std::invalid_argument);
    EXPECT_THROW(name_element::custom_long(""), std::invalid_argument);
}

// 5. duplicates are dropped
TEST(NameSpecificationTest, NoDuplicates) {
    parse_config cfg;
    name_specification naming{ name_element::long_name(), name_element::custom_long("name") };
    EXPECT_EQ(naming.make_names("name", cfg), (string_list{"--name"}));
}

// 6. token classes
TEST_F(NameMatcherTest, Classify) {
    name_matcher m{ p.definitions(), p.config() };

    auto exact = m.classify("--output-file");
    EXPECT_EQ(exact.type, token_class::option);
    EXPECT_EQ(exact.definition->key, "outputFile");

    auto inline_value = m.classify("--level=3");
    EXPECT_EQ(inline_value.type, token_class::inline_option);
    EXPECT_EQ(inline_value.inline_value, std::optional<std::string>{"3"});

    auto empty_inline = m.classify("-o=");
    EXPECT_EQ(empty_inline.type, token_class::inline_option);
    EXPECT_EQ(empty_inline.inline_value, std::optional<std::string>{""});

    EXPECT_EQ(m.classify("--nope=3").type, token_class::unrecognized);
    EXPECT_EQ(m.classify("--nope").type, token_class::unrecognized);
    EXPECT_EQ(m.classify("--").type, token_class::terminator);
    EXPECT_EQ(m.classify("-").type, token_class::value) << "A bare prefix is a value";
    EXPECT_EQ(m.classify("file.txt").type, token_class::value);
    EXPECT_EQ(m.classify("a=b").type, token_class::value);
}

// 7. grouped flags
TEST_F(NameMatcherTest, GroupedFlags) {
    name_matcher m{ p.definitions(), p.config() };

    auto grouped = m.classify("-vx");
    ASSERT_EQ(grouped.type, token_class::grouped_flags);
    ASSERT_EQ(grouped.flags.size(), 2u);
    EXPECT_EQ(grouped.flags[0]->key, "verbose");
    EXPECT_EQ(grouped.flags[1]->key, "x");

    EXPECT_EQ(m.classify("-vo").type, token_class::unrecognized) << "-o takes a value, it isn't a flag";
}

// 8. configured separator and prefixes
TEST_F(NameMatcherTest, Config) {
    parse_config cfg;
    cfg.long_prefix = "++";
    cfg.short_prefix = "+";
    cfg.inline_value_separator = ':';
    cfg.allow_terminator = false;
    p.set_config(cfg);

    EXPECT_EQ(p.find_definition("outputFile")->names, (string_list{"++output-file", "+o"}));

    name_matcher m{ p.definitions(), p.config() };
    EXPECT_EQ(m.classify("++level:3").type, token_class::inline_option);
    EXPECT_EQ(m.classify("--level").type, token_class::value);
    EXPECT_EQ(m.classify("--").type, token_class::value);
    EXPECT_EQ(m.classify("+vx").type, token_class::grouped_flags);
}

// 9. first declaration keeps a clashing name
TEST(NameMatcherClashTest, FirstDeclarationWins) {
    parser p;
    p.add_option<std::string>("output").set_names({ name_element::custom_short('o') });
    p.add_option<std::string>("other").set_names({ name_element::custom_short('o') });

    auto result = p.parse({"-o", "x"});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result->get<std::string>("output"), "x");
    EXPECT_FALSE(result->contains("other"));
}
