/**
 * @file exception.hxx
 * @brief Exception hierarchy used by the acceptlang integration layers.
 *
 * Header parsing and matching never throw; these types are raised only by
 * the negotiator configuration and the language catalog. Every exception
 * carries an error code, an optional message prefix, and the formatted message.
 */

#ifndef ACCEPTLANG_EXCEPTION_HXX
#define ACCEPTLANG_EXCEPTION_HXX

namespace acceptlang {
    /**
     * @brief Error codes attached to acceptlang exceptions.
     */
    enum struct e_error : std::int16_t {
        unknown,          ///< No specific code.
        not_initialized,  ///< A component was used before init().
        invalid_config,   ///< Configuration rejected during validation.
        unknown_language  ///< Lookup of a tag that is not in the catalog.
    };

    /**
     * @brief Base exception type for all acceptlang errors.
     */
    struct base_exception_t : public std::runtime_error {
        /**
         * @brief Construct an exception with a plain message.
         * @param str Error message.
         */
        ACCEPTLANG_INLINE base_exception_t(const std::string& str)
            : std::runtime_error(str), m_message(str), m_what(str) {
        }

        /**
         * @brief Construct an exception with a message, an error code, and an optional prefix.
         * @param str Error message.
         * @param code Associated error code.
         * @param prefix Prefix prepended as "[prefix] " to what().
         */
        ACCEPTLANG_INLINE base_exception_t(const std::string& str, const e_error& code, const std::string_view& prefix = "")
            : std::runtime_error(str), m_code(code), m_prefix(prefix), m_message(str),
              m_what(m_prefix.empty() ? m_message : fmt::format("[{}] {}", m_prefix, m_message)) {
        }

      public:
        /** @brief Error code (read-only). */
        [[nodiscard]] ACCEPTLANG_INLINE const auto& code() const { return m_code; }

        /** @brief Message prefix (read-only). */
        [[nodiscard]] ACCEPTLANG_INLINE const auto& prefix() const { return m_prefix; }

        /** @brief Message without prefix (read-only). */
        [[nodiscard]] ACCEPTLANG_INLINE const auto& message() const { return m_message; }

        /**
         * @brief Get the full formatted error message.
         * @return Null-terminated message including the prefix.
         */
        ACCEPTLANG_INLINE const char* what() const noexcept override { return m_what.c_str(); }

      private:
        /** @brief Error code. */
        e_error m_code{e_error::unknown};

        /** @brief Prefix used to qualify the message. */
        std::string m_prefix{};

        /** @brief Raw message content. */
        std::string m_message{};

        /** @brief Cached what() string. */
        std::string m_what{};
    };

    namespace exceptions {
        /**
         * @brief Raised when a negotiator configuration fails validation.
         *
         * Prefix defaults to "Config".
         */
        struct config_exception_t : public base_exception_t {
            ACCEPTLANG_INLINE config_exception_t(
                const std::string& str,

                const e_error& code = e_error::invalid_config,
                const std::string_view& prefix = "Config"
            )
                : base_exception_t(str, code, prefix) {
            }
        };

        /**
         * @brief Raised by catalog lookups that require the tag to exist.
         *
         * Prefix defaults to "Catalog".
         */
        struct lookup_exception_t : public base_exception_t {
            ACCEPTLANG_INLINE lookup_exception_t(
                const std::string& str,

                const e_error& code = e_error::unknown_language,
                const std::string_view& prefix = "Catalog"
            )
                : base_exception_t(str, code, prefix) {
            }
        };
    }
}

#endif // ACCEPTLANG_EXCEPTION_HXX
