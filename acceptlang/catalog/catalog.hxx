/**
 * @file catalog.hxx
 * @brief Display names for common languages, for building language selectors.
 *
 * The catalog is a read-only table kept apart from header parsing: nothing in
 * accept_language_t consults it.
 */

#ifndef ACCEPTLANG_CATALOG_HXX
#define ACCEPTLANG_CATALOG_HXX

namespace acceptlang::catalog {
    /**
     * @brief A value/label pair for a select control.
     */
    struct language_option_t {
        /** @brief Normalized tag submitted by the control. */
        std::string_view m_value{};

        /** @brief Human-readable name shown to the user. */
        std::string_view m_label{};
    };

    /**
     * @brief Lookup of English display names by normalized locale tag.
     */
    struct language_catalog_t {
      private:
        /** @brief Type alias for the catalog map. */
        using catalog_map_t = boost::unordered_map<std::string_view, std::string_view>;

        /** @brief Catalog entries, in presentation order. */
        inline static constexpr std::array<std::pair<std::string_view, std::string_view>, 41u> k_catalog_entries{
            {{"en", "English"},
             {"en-US", "English (US)"},
             {"en-GB", "English (UK)"},
             {"es", "Spanish"},
             {"es-ES", "Spanish (Spain)"},
             {"es-MX", "Spanish (Mexico)"},
             {"fr", "French"},
             {"fr-FR", "French (France)"},
             {"fr-CA", "French (Canada)"},
             {"de", "German"},
             {"de-DE", "German (Germany)"},
             {"de-AT", "German (Austria)"},
             {"it", "Italian"},
             {"pt", "Portuguese"},
             {"pt-BR", "Portuguese (Brazil)"},
             {"pt-PT", "Portuguese (Portugal)"},
             {"nl", "Dutch"},
             {"ru", "Russian"},
             {"ja", "Japanese"},
             {"zh", "Chinese"},
             {"zh-CN", "Chinese (Simplified)"},
             {"zh-TW", "Chinese (Traditional)"},
             {"ko", "Korean"},
             {"ar", "Arabic"},
             {"hi", "Hindi"},
             {"tr", "Turkish"},
             {"pl", "Polish"},
             {"sv", "Swedish"},
             {"da", "Danish"},
             {"no", "Norwegian"},
             {"fi", "Finnish"},
             {"el", "Greek"},
             {"he", "Hebrew"},
             {"th", "Thai"},
             {"vi", "Vietnamese"},
             {"id", "Indonesian"},
             {"ms", "Malay"},
             {"cs", "Czech"},
             {"hu", "Hungarian"},
             {"ro", "Romanian"},
             {"uk", "Ukrainian"}}
        };

        ACCEPTLANG_INLINE static const catalog_map_t& get_catalog_map() {
            static const catalog_map_t catalog_map = [] {
                catalog_map_t ret;

                ret.reserve(k_catalog_entries.size());

                for (const auto& [tag, label] : k_catalog_entries)
                    ret.emplace(tag, label);

                return ret;
            }();

            return catalog_map;
        }

      public:
        /**
         * @brief Get the display name of a language.
         * @param tag Locale code in any case or separator style ("pt_br").
         * @return Display name, or nullopt if the tag is not in the catalog.
         */
        ACCEPTLANG_INLINE static std::optional<std::string_view> get(const std::string_view& tag) {
            const auto normalized = locale::normalize(tag);

            if (normalized.empty())
                return std::nullopt;

            const auto& catalog_map = get_catalog_map();

            const auto it = catalog_map.find(std::string_view{normalized});

            if (it == catalog_map.end())
                return std::nullopt;

            return it->second;
        }

        /**
         * @brief Get the display name of a language that must be in the catalog.
         * @param tag Locale code.
         * @return Display name.
         * @throws exceptions::lookup_exception_t if the tag is unknown.
         */
        ACCEPTLANG_INLINE static std::string_view at(const std::string_view& tag) {
            const auto label = get(tag);

            if (!label.has_value())
                throw exceptions::lookup_exception_t(fmt::format("Unknown language tag: '{}'", tag));

            return *label;
        }

        /** @brief Check whether a tag is in the catalog. */
        ACCEPTLANG_INLINE static bool contains(const std::string_view& tag) { return get(tag).has_value(); }

        /** @brief Catalog entries in presentation order. */
        ACCEPTLANG_INLINE static constexpr const auto& entries() { return k_catalog_entries; }

        /**
         * @brief Catalog entries as select options.
         * @return One option per entry, in presentation order.
         */
        ACCEPTLANG_INLINE static std::vector<language_option_t> options() {
            std::vector<language_option_t> ret{};

            ret.reserve(k_catalog_entries.size());

            for (const auto& [tag, label] : k_catalog_entries)
                ret.push_back(language_option_t{tag, label});

            return ret;
        }

#ifdef ACCEPTLANG_HAS_JSON_IMPL
        /**
         * @brief Catalog as a JSON object mapping tag to display name.
         */
        ACCEPTLANG_INLINE static shared::json_traits_t::json_obj_t to_json() {
            shared::json_traits_t::json_obj_t ret{};

            for (const auto& [tag, label] : k_catalog_entries)
                shared::json_traits_t::set(ret, tag, label);

            return ret;
        }
#endif // ACCEPTLANG_HAS_JSON_IMPL
    };
}

#endif // ACCEPTLANG_CATALOG_HXX
