#include <acceptlang.hxx>

namespace acceptlang {
    preference_list_t accept_language_t::parse(const std::string_view& header) {
        preference_list_t ret{};

        if (header.empty())
            return ret;

        const std::string value{header};

        std::vector<std::string> entries{};

        boost::algorithm::split(entries, value, boost::algorithm::is_any_of(","));

        boost::unordered_map<std::string, std::size_t> positions{};

        for (auto& entry : entries) {
            boost::algorithm::trim(entry);

            if (entry.empty())
                continue;

            std::string_view tag{entry};

            auto quality = k_default_quality;

            if (const auto semi = tag.find(';'); semi != std::string_view::npos) {
                quality = _parse_quality(tag.substr(semi + 1u));

                tag = tag.substr(0u, semi);
            }

            auto normalized = locale::normalize(tag);

            if (normalized.empty()) {
#ifdef ACCEPTLANG_USE_LOGGING_IMPL
                g_logging->log(e_log_level::debug, "[Parser] Dropped entry without a language tag: '{}'", entry);
#endif // ACCEPTLANG_USE_LOGGING_IMPL

                continue;
            }

            if (const auto it = positions.find(normalized); it != positions.end()) {
                ret[it->second].m_quality = quality;

                continue;
            }

            positions.emplace(normalized, ret.size());

            ret.push_back(preference_t{std::move(normalized), quality});
        }

        std::ranges::stable_sort(ret, std::ranges::greater{}, &preference_t::m_quality);

        return ret;
    }

    double accept_language_t::_parse_quality(const std::string_view& params) {
        constexpr std::string_view k_number_chars = "0123456789.";

        for (auto pos = params.find("q="); pos != std::string_view::npos; pos = params.find("q=", pos + 1u)) {
            const auto begin = pos + 2u;
            const auto end = std::min(params.find_first_not_of(k_number_chars, begin), params.size());

            if (begin >= end)
                continue;

            const auto number = params.substr(begin, end - begin);

            double quality{};

            const auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), quality);

            // a run of dots alone reads as zero
            if (ec == std::errc::invalid_argument)
                return 0.0;

            // only the integer part decides between overflow and underflow
            if (ec == std::errc::result_out_of_range)
                return number.find_first_not_of('0') < number.find('.') ? 1.0 : 0.0;

            return std::clamp(quality, 0.0, 1.0);
        }

        return k_default_quality;
    }

    std::optional<locale::locale_tag_t> accept_language_t::get_primary(const std::string_view& header) {
        auto preferences = parse(header);

        if (preferences.empty())
            return std::nullopt;

        return std::move(preferences.front().m_tag);
    }

    std::optional<std::string> accept_language_t::get_primary_language(const std::string_view& header) {
        const auto primary = get_primary(header);

        if (!primary.has_value())
            return std::nullopt;

        return locale::extract_language(*primary);
    }

    std::optional<std::string> accept_language_t::get_primary_region(const std::string_view& header) {
        const auto primary = get_primary(header);

        if (!primary.has_value())
            return std::nullopt;

        return locale::extract_region(*primary);
    }

    std::vector<locale::locale_tag_t> accept_language_t::get_all(const std::string_view& header) {
        auto preferences = parse(header);

        std::vector<locale::locale_tag_t> ret{};

        ret.reserve(preferences.size());

        for (auto& preference : preferences)
            ret.push_back(std::move(preference.m_tag));

        return ret;
    }

    std::vector<std::string> accept_language_t::get_languages(const std::string_view& header) {
        std::vector<std::string> ret{};

        for (const auto& tag : get_all(header)) {
            auto language = locale::extract_language(tag);

            if (language.empty()
                || std::ranges::find(ret, language) != ret.end())
                continue;

            ret.push_back(std::move(language));
        }

        return ret;
    }

    bool accept_language_t::accepts(const std::string_view& header, const std::string_view& language, bool exact) {
        const auto normalized = locale::normalize(language);

        if (normalized.empty())
            return false;

        const auto preferences = parse(header);

        if (std::ranges::find(preferences, normalized, &preference_t::m_tag) != preferences.end())
            return true;

        if (exact)
            return false;

        const auto base = locale::extract_language(normalized);

        return std::ranges::any_of(preferences, [&base](const preference_t& preference) {
            return locale::extract_language(preference.m_tag) == base;
        });
    }

    std::optional<double> accept_language_t::get_quality(const std::string_view& header, const std::string_view& language) {
        const auto normalized = locale::normalize(language);

        if (normalized.empty())
            return std::nullopt;

        const auto preferences = parse(header);

        const auto it = std::ranges::find(preferences, normalized, &preference_t::m_tag);

        if (it == preferences.end())
            return std::nullopt;

        return it->m_quality;
    }

    std::optional<std::string> accept_language_t::get_best_match(
        const std::string_view& header,

        const std::vector<std::string>& available,

        const std::optional<std::string>& default_language
    ) {
        if (available.empty())
            return default_language;

        const auto preferences = parse(header);

        if (preferences.empty())
            return default_language;

        // normalized -> original, in first-insertion order; later duplicates replace the original
        std::vector<std::pair<locale::locale_tag_t, std::string>> candidates{};

        boost::unordered_map<locale::locale_tag_t, std::size_t> positions{};

        for (const auto& language : available) {
            auto normalized = locale::normalize(language);

            if (normalized.empty())
                continue;

            if (const auto it = positions.find(normalized); it != positions.end()) {
                candidates[it->second].second = language;

                continue;
            }

            positions.emplace(normalized, candidates.size());

            candidates.emplace_back(std::move(normalized), language);
        }

        for (const auto& preference : preferences) {
            if (const auto it = positions.find(preference.m_tag); it != positions.end())
                return candidates[it->second].second;
        }

        for (const auto& preference : preferences) {
            const auto base = locale::extract_language(preference.m_tag);

            for (const auto& [normalized, original] : candidates) {
                if (locale::extract_language(normalized) == base)
                    return original;
            }
        }

        return default_language;
    }

    bool accept_language_t::is_rtl(const std::string_view& header) {
        const auto language = get_primary_language(header);

        if (!language.has_value())
            return false;

        return locale::is_rtl_language(*language);
    }

    std::string accept_language_t::to_string(const preference_list_t& preferences) {
        std::vector<std::string> entries{};

        entries.reserve(preferences.size());

        for (const auto& preference : preferences)
            entries.push_back(fmt::format("{};q={}", preference.m_tag, preference.m_quality));

        return fmt::format("{}", fmt::join(entries, ", "));
    }
}
