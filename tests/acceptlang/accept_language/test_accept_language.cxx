#include <gtest/gtest.h>

#include <acceptlang.hxx>

using namespace acceptlang;

namespace {
    constexpr std::string_view k_browser_header = "en-US,en;q=0.9,de;q=0.8";
}

TEST(AcceptLanguageTest, ParseOrdersByQuality) {
    const auto preferences = accept_language_t::parse(k_browser_header);

    const preference_list_t expected{
        {"en-US", 1.0},
        {"en", 0.9},
        {"de", 0.8}
    };

    EXPECT_EQ(preferences, expected);
}

TEST(AcceptLanguageTest, ParseEmptyAndBlankHeaders) {
    EXPECT_TRUE(accept_language_t::parse("").empty());
    EXPECT_TRUE(accept_language_t::parse("   ").empty());
    EXPECT_TRUE(accept_language_t::parse(",,, ,").empty());
    EXPECT_TRUE(accept_language_t::parse(";q=0.5, ;q=1").empty());
}

TEST(AcceptLanguageTest, ParseReordersUnsortedHeader) {
    const auto preferences = accept_language_t::parse("da;q=0.3, en-gb;q=0.8, en_US, fr;q=0.5");

    ASSERT_EQ(preferences.size(), 4u);

    EXPECT_EQ(preferences[0].m_tag, "en-US");
    EXPECT_EQ(preferences[1].m_tag, "en-GB");
    EXPECT_EQ(preferences[2].m_tag, "fr");
    EXPECT_EQ(preferences[3].m_tag, "da");

    EXPECT_DOUBLE_EQ(preferences[1].m_quality, 0.8);
    EXPECT_DOUBLE_EQ(preferences[3].m_quality, 0.3);
}

TEST(AcceptLanguageTest, ParseTiesKeepHeaderOrder) {
    const auto preferences = accept_language_t::parse("fr;q=0.5,de,it;q=0.5,es,nl;q=0.5");

    const std::vector<std::string> expected{"de", "es", "fr", "it", "nl"};

    std::vector<std::string> tags{};

    for (const auto& preference : preferences)
        tags.push_back(preference.m_tag);

    EXPECT_EQ(tags, expected);
}

TEST(AcceptLanguageTest, ParseDuplicatesKeepFirstPositionAndLastQuality) {
    const auto preferences = accept_language_t::parse("en-us;q=0.4,fr;q=0.4,EN_US;q=0.2,de;q=0.4");

    const preference_list_t expected{
        {"fr", 0.4},
        {"de", 0.4},
        {"en-US", 0.2}
    };

    EXPECT_EQ(preferences, expected);

    const auto raised = accept_language_t::parse("en;q=0.1,fr;q=0.5,en");

    ASSERT_EQ(raised.size(), 2u);

    EXPECT_EQ(raised[0].m_tag, "en");
    EXPECT_DOUBLE_EQ(raised[0].m_quality, 1.0);
}

TEST(AcceptLanguageTest, ParseQualityEdgeCases) {
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en;q=abc").front().m_quality, 1.0);
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en;level=1").front().m_quality, 1.0);
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en;").front().m_quality, 1.0);
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en;level=1;q=0.3").front().m_quality, 0.3);
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en; q=.5").front().m_quality, 0.5);
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en;q=0").front().m_quality, 0.0);
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en;q=0.5.1").front().m_quality, 0.5);
    EXPECT_DOUBLE_EQ(accept_language_t::parse("en;q=7").front().m_quality, 1.0);
}

TEST(AcceptLanguageTest, ParseQualityHelper) {
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality("q=0.75"), 0.75);
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality("q=1."), 1.0);
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality("q=."), 0.0);
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality("q=.."), 0.0);
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality("q=..5"), 0.0);
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality("q=abc;q=0.3"), 0.3);
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality(""), accept_language_t::k_default_quality);
    EXPECT_DOUBLE_EQ(accept_language_t::_parse_quality("q=-0.5"), accept_language_t::k_default_quality);
}

TEST(AcceptLanguageTest, ParseDotOnlyQualityRanksLast) {
    const auto preferences = accept_language_t::parse("en;q=.,de;q=0.5");

    ASSERT_EQ(preferences.size(), 2u);

    EXPECT_EQ(preferences[0].m_tag, "de");
    EXPECT_EQ(preferences[1].m_tag, "en");
    EXPECT_DOUBLE_EQ(preferences[1].m_quality, 0.0);
}

TEST(AcceptLanguageTest, ParseLongQualityValues) {
    const auto fraction = accept_language_t::parse("en;q=0." + std::string(100000u, '5') + ",de;q=0.6");

    ASSERT_EQ(fraction.size(), 2u);

    EXPECT_EQ(fraction[0].m_tag, "de");
    EXPECT_NEAR(fraction[1].m_quality, 0.5555555, 1e-6);

    const auto huge = accept_language_t::parse("fr;q=0.4,en;q=" + std::string(100000u, '9'));

    ASSERT_EQ(huge.size(), 2u);

    EXPECT_EQ(huge[0].m_tag, "en");
    EXPECT_DOUBLE_EQ(huge[0].m_quality, 1.0);

    const auto tiny = accept_language_t::parse("en;q=0." + std::string(100000u, '0') + "1");

    ASSERT_EQ(tiny.size(), 1u);

    EXPECT_DOUBLE_EQ(tiny[0].m_quality, 0.0);
}

TEST(AcceptLanguageTest, ParseOutputInvariants) {
    for (const auto* header : {
             "en-US,en;q=0.9,de;q=0.8",
             "fr-CH, fr;q=0.9, en;q=0.8, de;q=0.7, *;q=0.5",
             "EN_gb;q=3, en-GB;q=0.2, zh-hans-cn;q=0.6,,;q=1",
             "ar;q=0.1 , HE ; q=0.9,fa_IR;q=0.95"
         }) {
        const auto preferences = accept_language_t::parse(header);

        std::vector<std::string> seen{};

        for (std::size_t i{}; i < preferences.size(); i++) {
            const auto& preference = preferences[i];

            EXPECT_GE(preference.m_quality, 0.0) << header;
            EXPECT_LE(preference.m_quality, 1.0) << header;

            EXPECT_EQ(accept_language_t::normalize(preference.m_tag), preference.m_tag) << header;

            EXPECT_EQ(std::ranges::find(seen, preference.m_tag), seen.end()) << header;

            seen.push_back(preference.m_tag);

            if (i > 0u)
                EXPECT_GE(preferences[i - 1u].m_quality, preference.m_quality) << header;
        }
    }
}

TEST(AcceptLanguageTest, PrimaryQueries) {
    EXPECT_EQ(accept_language_t::get_primary(k_browser_header), "en-US");
    EXPECT_EQ(accept_language_t::get_primary_language(k_browser_header), "en");
    EXPECT_EQ(accept_language_t::get_primary_region(k_browser_header), "US");

    EXPECT_EQ(accept_language_t::get_primary_region("de;q=0.9"), std::nullopt);

    EXPECT_EQ(accept_language_t::get_primary(""), std::nullopt);
    EXPECT_EQ(accept_language_t::get_primary_language(""), std::nullopt);
    EXPECT_EQ(accept_language_t::get_primary_region(""), std::nullopt);
}

TEST(AcceptLanguageTest, GetAllAndLanguages) {
    const std::vector<std::string> all{"en-US", "en", "de"};
    const std::vector<std::string> languages{"en", "de"};

    EXPECT_EQ(accept_language_t::get_all(k_browser_header), all);
    EXPECT_EQ(accept_language_t::get_languages(k_browser_header), languages);

    const std::vector<std::string> mixed{"pt", "en", "es"};

    EXPECT_EQ(accept_language_t::get_languages("pt-BR,pt-PT;q=0.9,en-GB;q=0.8,pt;q=0.7,es-419;q=0.6"), mixed);

    EXPECT_TRUE(accept_language_t::get_all("").empty());
    EXPECT_TRUE(accept_language_t::get_languages("").empty());
}

TEST(AcceptLanguageTest, AcceptsBaseAndExact) {
    EXPECT_TRUE(accept_language_t::accepts("de-DE", "de"));
    EXPECT_FALSE(accept_language_t::accepts("de-DE", "de", true));

    EXPECT_TRUE(accept_language_t::accepts("de-DE", "DE_de", true));
    EXPECT_TRUE(accept_language_t::accepts("de", "de-CH"));
    EXPECT_FALSE(accept_language_t::accepts("de", "de-CH", true));

    EXPECT_FALSE(accept_language_t::accepts(k_browser_header, "fr"));
    EXPECT_FALSE(accept_language_t::accepts(k_browser_header, ""));
    EXPECT_FALSE(accept_language_t::accepts(k_browser_header, "   "));
    EXPECT_FALSE(accept_language_t::accepts("", "en"));
}

TEST(AcceptLanguageTest, QualityIsExactOnly) {
    EXPECT_EQ(accept_language_t::get_quality(k_browser_header, "EN"), 0.9);
    EXPECT_EQ(accept_language_t::get_quality(k_browser_header, "en_us"), 1.0);
    EXPECT_EQ(accept_language_t::get_quality(k_browser_header, "de-AT"), std::nullopt);
    EXPECT_EQ(accept_language_t::get_quality(k_browser_header, ""), std::nullopt);
    EXPECT_EQ(accept_language_t::get_quality("", "en"), std::nullopt);
}

TEST(AcceptLanguageTest, BestMatchExactPass) {
    EXPECT_EQ(accept_language_t::get_best_match(k_browser_header, {"de", "fr"}, "en"), "de");
    EXPECT_EQ(accept_language_t::get_best_match(k_browser_header, {"fr", "EN_us", "en"}), "EN_us");
}

TEST(AcceptLanguageTest, BestMatchBaseLanguageFallback) {
    EXPECT_EQ(accept_language_t::get_best_match("fr-CA;q=0.5", {"fr"}), "fr");
    EXPECT_EQ(accept_language_t::get_best_match("fr-CA;q=0.5", {"de", "fr-FR", "fr-BE"}, "de"), "fr-FR");
    EXPECT_EQ(accept_language_t::get_best_match("pt-BR,es;q=0.5", {"es-ES", "pt-PT"}), "pt-PT");
}

TEST(AcceptLanguageTest, BestMatchExactnessDominatesQuality) {
    EXPECT_EQ(accept_language_t::get_best_match("fr;q=0.2,de;q=1.0", {"fr", "xx"}), "fr");
    EXPECT_EQ(accept_language_t::get_best_match("de-AT,fr;q=0.2", {"de", "fr"}), "fr");
}

TEST(AcceptLanguageTest, BestMatchDefaults) {
    EXPECT_EQ(accept_language_t::get_best_match(k_browser_header, {}, "en"), "en");
    EXPECT_EQ(accept_language_t::get_best_match("", {"de"}, "en"), "en");
    EXPECT_EQ(accept_language_t::get_best_match(k_browser_header, {"ja", "ko"}, "fr"), "fr");
    EXPECT_EQ(accept_language_t::get_best_match(k_browser_header, {"ja", "ko"}), std::nullopt);
    EXPECT_EQ(accept_language_t::get_best_match(k_browser_header, {"", "  "}, "fr"), "fr");
}

TEST(AcceptLanguageTest, BestMatchDuplicateCandidatesUseLastSpelling) {
    EXPECT_EQ(accept_language_t::get_best_match("de-CH", {"de-de", "it", "DE_DE"}), "DE_DE");
}

TEST(AcceptLanguageTest, IsRtl) {
    EXPECT_TRUE(accept_language_t::is_rtl("ar-EG,en;q=0.5"));
    EXPECT_TRUE(accept_language_t::is_rtl("he"));
    EXPECT_TRUE(accept_language_t::is_rtl("en;q=0.4,fa;q=0.9"));

    EXPECT_FALSE(accept_language_t::is_rtl("en-US,ar;q=0.9"));
    EXPECT_FALSE(accept_language_t::is_rtl(""));
}

TEST(AcceptLanguageTest, ToString) {
    EXPECT_EQ(accept_language_t::to_string(accept_language_t::parse(k_browser_header)), "en-US;q=1, en;q=0.9, de;q=0.8");
    EXPECT_EQ(accept_language_t::to_string({}), "");
}
