/**
 * @file accept_language.hxx
 * @brief Accept-Language header parsing and language matching.
 *
 * Implements the comma-separated "tag[;q=value]" grammar of RFC 7231 section
 * 5.3.5, limited to two-part language-region tags. Every query re-parses the
 * header it is given; nothing is cached and no state is shared between calls.
 */

#ifndef ACCEPTLANG_ACCEPT_LANGUAGE_HXX
#define ACCEPTLANG_ACCEPT_LANGUAGE_HXX

namespace acceptlang {
    /**
     * @brief A single parsed preference.
     */
    struct preference_t {
        /** @brief Normalized locale tag. */
        locale::locale_tag_t m_tag{};

        /** @brief Quality value in [0.0, 1.0]. */
        double m_quality{1.0};

        bool operator==(const preference_t&) const = default;
    };

    /** @brief Preferences with unique tags, ordered by descending quality. */
    using preference_list_t = std::vector<preference_t>;

    /**
     * @brief Accept-Language parser and the queries derived from it.
     *
     * All members are static. Header-sourced queries take the raw header value
     * explicitly; an empty value means the header was absent.
     */
    struct accept_language_t {
        /** @brief Quality assumed when an entry carries no usable q parameter. */
        static constexpr double k_default_quality = 1.0;

        /**
         * @brief Parse a raw header into preferences.
         * @param header Raw header value.
         * @return Unique normalized tags sorted by quality, highest first.
         *
         * Entries with equal quality keep their header order. A tag listed more
         * than once keeps its first position and the quality of its last
         * occurrence. Malformed q values fall back to 1.0, out of range values
         * are clamped, and entries that normalize to nothing are dropped.
         */
        static preference_list_t parse(const std::string_view& header);

        /**
         * @brief Highest ranked tag.
         * @param header Raw header value.
         * @return The first parsed tag, or nullopt if there are none.
         */
        static std::optional<locale::locale_tag_t> get_primary(const std::string_view& header);

        /** @brief Base language of the primary tag, or nullopt. */
        static std::optional<std::string> get_primary_language(const std::string_view& header);

        /** @brief Region of the primary tag, or nullopt if there is no primary tag or it has no region. */
        static std::optional<std::string> get_primary_region(const std::string_view& header);

        /**
         * @brief All parsed tags in preference order, without qualities.
         * @param header Raw header value.
         */
        static std::vector<locale::locale_tag_t> get_all(const std::string_view& header);

        /**
         * @brief Unique base languages in preference order.
         * @param header Raw header value.
         * @return Base languages in order of first occurrence ("en-US,en,de" gives {"en", "de"}).
         */
        static std::vector<std::string> get_languages(const std::string_view& header);

        /**
         * @brief Check whether the client accepts a language.
         * @param header Raw header value.
         * @param language Candidate code, normalized before comparison.
         * @param exact Require an exact tag match instead of allowing a shared base language.
         * @return False for a blank candidate or when nothing matches.
         */
        static bool accepts(const std::string_view& header, const std::string_view& language, bool exact = false);

        /**
         * @brief Quality the client assigned to a language.
         * @param header Raw header value.
         * @param language Candidate code, normalized before lookup.
         * @return The quality of an exact tag match; base languages are not considered.
         */
        static std::optional<double> get_quality(const std::string_view& header, const std::string_view& language);

        /**
         * @brief Pick the best of the languages a site offers.
         * @param header Raw header value.
         * @param available Offered codes, in the site's order of preference.
         * @param default_language Returned when nothing matches.
         * @return The original string from @p available, or @p default_language.
         *
         * An exact tag match for any preference wins over a base-language match,
         * regardless of quality. Base-language matches are tried preference by
         * preference, scanning @p available in order.
         */
        static std::optional<std::string> get_best_match(
            const std::string_view& header,

            const std::vector<std::string>& available,

            const std::optional<std::string>& default_language = std::nullopt
        );

        /**
         * @brief Check whether the client's primary language is written right-to-left.
         * @param header Raw header value.
         */
        static bool is_rtl(const std::string_view& header);

        /**
         * @brief Render preferences back into header form.
         * @param preferences Parsed preferences.
         * @return "tag;q=value" entries joined by ", ".
         */
        static std::string to_string(const preference_list_t& preferences);

      public:
        /** @brief See locale::normalize. */
        ACCEPTLANG_INLINE static locale::locale_tag_t normalize(const std::string_view& code) { return locale::normalize(code); }

        /** @brief See locale::extract_language. */
        ACCEPTLANG_INLINE static std::string extract_language(const std::string_view& code) { return locale::extract_language(code); }

        /** @brief See locale::extract_region. */
        ACCEPTLANG_INLINE static std::optional<std::string> extract_region(const std::string_view& code) { return locale::extract_region(code); }

      public:
        /**
         * @brief Extract the q value from the parameter part of an entry.
         *
         * Takes the first `q=` followed by a run of digits and dots and reads the
         * longest numeric prefix of that run. A run without digits reads as 0.
         *
         * @param params Text after the first ';' of an entry.
         * @return The clamped q value, or k_default_quality if no `q=` run exists.
         */
        static double _parse_quality(const std::string_view& params);
    };
}

#endif // ACCEPTLANG_ACCEPT_LANGUAGE_HXX
