/**
 * @file locale.hxx
 * @brief Locale tag normalization and decomposition helpers.
 *
 * A normalized tag has a lowercase language subtag, and optionally a hyphen
 * followed by an uppercase region part ("en-US", "de"). Only the two-part
 * language-region shape is understood; scripts and variants are not parsed.
 */

#ifndef ACCEPTLANG_LOCALE_HXX
#define ACCEPTLANG_LOCALE_HXX

namespace acceptlang::locale {
    /** @brief Type alias for a normalized locale tag. */
    using locale_tag_t = std::string;

    /** @brief Languages written right-to-left. */
    inline constexpr std::array<std::string_view, 10u> k_rtl_languages{
        "ar", // Arabic
        "he", // Hebrew
        "fa", // Persian
        "ur", // Urdu
        "yi", // Yiddish
        "ps", // Pashto
        "sd", // Sindhi
        "ug", // Uyghur
        "ku", // Kurdish (Sorani)
        "dv"  // Divehi
    };

    /**
     * @brief Normalize a language code to "language[-REGION]" form.
     * @param code Raw code, e.g. " EN_us ".
     * @return Normalized tag ("en-US"), or an empty string for blank input.
     *
     * Underscores become hyphens and the code is split at the first hyphen
     * only: everything after it is uppercased as one region part.
     */
    ACCEPTLANG_INLINE locale_tag_t normalize(const std::string_view& code) {
        auto ret = boost::algorithm::trim_copy(std::string{code});

        if (ret.empty())
            return {};

        boost::algorithm::replace_all(ret, "_", "-");

        const auto pos = ret.find('-');

        if (pos == std::string::npos)
            return boost::algorithm::to_lower_copy(ret);

        return fmt::format(
            "{}-{}",

            boost::algorithm::to_lower_copy(ret.substr(0u, pos)),
            boost::algorithm::to_upper_copy(ret.substr(pos + 1u))
        );
    }

    /**
     * @brief Extract the base language of a locale.
     * @param locale Locale string ("en-US", "de_AT", "fr").
     * @return Lowercase text before the first separator, or the whole string lowercased.
     */
    ACCEPTLANG_INLINE std::string extract_language(const std::string_view& locale) {
        auto code = boost::algorithm::replace_all_copy(std::string{locale}, "_", "-");

        if (const auto pos = code.find('-'); pos != std::string::npos)
            code.resize(pos);

        boost::algorithm::to_lower(code);

        return code;
    }

    /**
     * @brief Extract the region of a locale.
     * @param locale Locale string ("en-US", "de_AT").
     * @return Second hyphen-separated part uppercased, or nullopt if there is no separator.
     *
     * Only the second part is taken: "zh-Hans-CN" yields "HANS".
     */
    ACCEPTLANG_INLINE std::optional<std::string> extract_region(const std::string_view& locale) {
        const auto code = boost::algorithm::replace_all_copy(std::string{locale}, "_", "-");

        if (code.find('-') == std::string::npos)
            return std::nullopt;

        std::vector<std::string> parts{};

        boost::algorithm::split(parts, code, boost::algorithm::is_any_of("-"));

        if (parts.size() < 2u)
            return std::nullopt;

        return boost::algorithm::to_upper_copy(parts[1u]);
    }

    /**
     * @brief Check whether a base language is written right-to-left.
     * @param language Lowercase base language ("ar").
     */
    ACCEPTLANG_INLINE bool is_rtl_language(const std::string_view& language) {
        return std::ranges::find(k_rtl_languages, language) != k_rtl_languages.end();
    }
}

#endif // ACCEPTLANG_LOCALE_HXX
