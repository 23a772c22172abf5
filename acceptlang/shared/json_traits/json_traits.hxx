/**
 * @file json_traits.hxx
 * @brief JSON backend selection (Glaze or nlohmann::json) for exported catalog data.
 */

#ifndef ACCEPTLANG_SHARED_JSON_TRAITS_HXX
#define ACCEPTLANG_SHARED_JSON_TRAITS_HXX

#if defined(ACCEPTLANG_USE_GLAZE_JSON) || defined(ACCEPTLANG_USE_NLOHMANN_JSON)
#define ACCEPTLANG_HAS_JSON_IMPL
#endif

namespace shared {
    /**
     * @brief Backend-neutral access to JSON documents.
     *
     * Exactly one definition is active, chosen by ACCEPTLANG_USE_GLAZE_JSON or
     * ACCEPTLANG_USE_NLOHMANN_JSON (Glaze wins if both are set).
     */
    struct json_traits_t;

#if defined(ACCEPTLANG_USE_GLAZE_JSON)
    struct json_traits_t final {
        /** @brief Serialized document type. */
        using json_type_t = std::string;

        /** @brief Generic document type. */
        using json_obj_t = glz::json_t;

        /**
         * @brief Write a value as JSON text.
         * @tparam _type_t Type of the value (default is json_obj_t).
         * @param value Value to write.
         * @return JSON text.
         * @throws std::runtime_error if Glaze reports an error.
         */
        template <typename _type_t = json_obj_t>
        ACCEPTLANG_INLINE static json_type_t serialize(const _type_t& value) {
            json_type_t ret{};

            if (const auto err = glz::write_json(value, ret); err)
                throw std::runtime_error("Can't serialize value to json");

            return ret;
        }

        /**
         * @brief Read a value from JSON text.
         * @tparam _type_t Type to read (default is json_obj_t).
         * @param json JSON text.
         * @return Parsed value.
         * @throws std::runtime_error on malformed input.
         */
        template <typename _type_t = json_obj_t>
        ACCEPTLANG_INLINE static _type_t deserialize(const json_type_t& json) {
            auto ret = glz::read_json<_type_t>(json);

            if (!ret)
                throw std::runtime_error("Can't deserialize json to value");

            return *ret;
        }

        /**
         * @brief Assign a string member of an object document.
         * @param obj Document to modify.
         * @param key Member name.
         * @param value Member value.
         */
        ACCEPTLANG_INLINE static void set(json_obj_t& obj, const std::string_view& key, const std::string_view& value) {
            obj[key] = std::string{value};
        }

        /**
         * @brief Read a member of an object document.
         * @tparam _type_t Type of the member.
         * @param obj Document to read.
         * @param key Member name.
         * @return Member value.
         */
        template <typename _type_t>
        ACCEPTLANG_INLINE static _type_t at(const json_obj_t& obj, const std::string_view& key) { return obj[key].get<_type_t>(); }

        /**
         * @brief Check whether an object document has a member.
         */
        ACCEPTLANG_INLINE static bool contains(const json_obj_t& obj, const std::string_view& key) { return obj.contains(key); }
    };
#elif defined(ACCEPTLANG_USE_NLOHMANN_JSON)
    struct json_traits_t final {
        /** @brief Serialized document type. */
        using json_type_t = std::string;

        /** @brief Generic document type. */
        using json_obj_t = nlohmann::json;

        /**
         * @brief Write a value as JSON text.
         * @tparam _type_t Type of the value (default is json_obj_t).
         * @param value Value to write.
         * @return JSON text.
         * @throws std::runtime_error if the value can't be converted.
         */
        template <typename _type_t = json_obj_t>
        ACCEPTLANG_INLINE static json_type_t serialize(const _type_t& value) {
            try {
                const nlohmann::json document = value;

                return document.dump();
            }
            catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("Can't serialize value to json: {}", e.what()));
            }
        }

        /**
         * @brief Read a value from JSON text.
         * @tparam _type_t Type to read (default is json_obj_t).
         * @param json JSON text.
         * @return Parsed value.
         * @throws std::runtime_error on malformed input.
         */
        template <typename _type_t = json_obj_t>
        ACCEPTLANG_INLINE static _type_t deserialize(const json_type_t& json) {
            try {
                return nlohmann::json::parse(json).get<_type_t>();
            }
            catch (const std::exception& e) {
                throw std::runtime_error(fmt::format("Can't deserialize json to value: {}", e.what()));
            }
        }

        /**
         * @brief Assign a string member of an object document.
         * @param obj Document to modify.
         * @param key Member name.
         * @param value Member value.
         */
        ACCEPTLANG_INLINE static void set(json_obj_t& obj, const std::string_view& key, const std::string_view& value) {
            obj[std::string{key}] = std::string{value};
        }

        /**
         * @brief Read a member of an object document.
         * @tparam _type_t Type of the member.
         * @param obj Document to read.
         * @param key Member name.
         * @return Member value.
         */
        template <typename _type_t>
        ACCEPTLANG_INLINE static _type_t at(const json_obj_t& obj, const std::string_view& key) { return obj.at(std::string{key}).get<_type_t>(); }

        /**
         * @brief Check whether an object document has a member.
         */
        ACCEPTLANG_INLINE static bool contains(const json_obj_t& obj, const std::string_view& key) { return obj.contains(std::string{key}); }
    };
#endif
}

#endif // ACCEPTLANG_SHARED_JSON_TRAITS_HXX
