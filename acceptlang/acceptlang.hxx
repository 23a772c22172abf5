/**
 * @file acceptlang.hxx
 * @brief Main public API and configuration structures for acceptlang.
 */

#ifndef ACCEPTLANG_HXX
#define ACCEPTLANG_HXX

#include "shared/shared.hxx"

/**
 * @namespace acceptlang
 * @brief Main namespace for Accept-Language parsing and content negotiation.
 */
namespace acceptlang {
#ifdef ACCEPTLANG_USE_LOGGING_IMPL
    /** @brief Alias for the shared logging implementation. */
    using c_logging = shared::c_logging;

    /** @brief Alias for the shared logging level enumeration. */
    using e_log_level = shared::e_log_level;

    /** @brief Global logger instance for acceptlang. */
    inline const auto g_logging = std::make_unique<shared::c_logging>();
#endif // ACCEPTLANG_USE_LOGGING_IMPL
}

#include "exception/exception.hxx"

#include "locale/locale.hxx"

#include "http/http.hxx"

#include "accept_language/accept_language.hxx"

#include "catalog/catalog.hxx"

namespace acceptlang {
    /**
     * @brief Configuration parameters for c_negotiator.
     */
    struct negotiator_cfg_t {
        /** @brief Languages the site can serve, most preferred first. (default: none) */
        std::vector<std::string> m_available{};

        /** @brief Language used when nothing in m_available matches. (default: none) */
        std::optional<std::string> m_default{};

        /** @brief Reject blank entries in m_available and a blank m_default instead of warning. (default: false) */
        bool m_strict{false};

#ifdef ACCEPTLANG_HAS_LOGGING_IMPL
        /**
         * @brief Configuration for the acceptlang logger.
         */
        struct logger_t {
            /** @brief Minimum severity level to log. (default: info) */
            e_log_level m_level{e_log_level::info};

            /** @brief Whether to flush output immediately after each message. (default: false) */
            bool m_force_flush{false};

            /** @brief Enable asynchronous logging. (default: true) */
            bool m_async{true};

            /** @brief Size of the internal log buffer. (default: 16384) */
            std::size_t m_buffer_size{16384u};

            /** @brief Strategy for handling buffer overflows. (default: discard_oldest) */
            c_logging::e_overflow_strategy m_strategy{c_logging::e_overflow_strategy::discard_oldest};
        };

        /** @brief Logger configuration. */
        logger_t m_logger{};
#endif
    };

    /**
     * @brief Outcome of negotiating one request.
     */
    struct negotiation_t {
        /** @brief Selected language as spelled in the configuration, or the default, or nullopt. */
        std::optional<std::string> m_language{};

        /** @brief Quality the client gave the selected language, if it listed that exact tag. */
        std::optional<double> m_quality{};

        /** @brief Whether the client's primary language is right-to-left. */
        bool m_rtl{};

        /** @brief Client's tags in preference order. */
        std::vector<locale::locale_tag_t> m_preferences{};
    };

    /**
     * @brief Chooses a site language for incoming requests.
     *
     * Binds a validated list of available languages to accept_language_t and
     * writes the matching response headers.
     */
    class c_negotiator {
      public:
        ACCEPTLANG_INLINE c_negotiator() : m_cfg(), m_initialized(false) {}

      public:
        /**
         * @brief Validate and apply a configuration.
         * @param cfg Configuration settings.
         * @throws exceptions::config_exception_t in strict mode if a language entry is blank.
         */
        void init(negotiator_cfg_t cfg);

        /**
         * @brief Negotiate against a raw Accept-Language value.
         * @param header Raw header value; empty if the client sent none.
         * @return Negotiation outcome.
         * @throws base_exception_t if init() has not been called.
         */
        negotiation_t negotiate(const std::string_view& header) const;

        /**
         * @brief Negotiate against the Accept-Language header of a request.
         * @param request Incoming request.
         * @return Negotiation outcome.
         * @throws base_exception_t if init() has not been called.
         */
        negotiation_t negotiate(const http::request_t& request) const;

        /**
         * @brief Write Content-Language and Vary for a negotiation outcome.
         * @param negotiation Outcome returned by negotiate().
         * @param headers Response headers to modify.
         */
        static void apply(const negotiation_t& negotiation, http::headers_t& headers);

      public:
        /**
         * @brief Get a reference to the configuration.
         * @return Const reference to the configuration structure.
         */
        [[nodiscard]] ACCEPTLANG_INLINE const auto& cfg() const { return m_cfg; }

        /**
         * @brief Whether init() completed.
         */
        [[nodiscard]] ACCEPTLANG_INLINE bool initialized() const { return m_initialized.load(std::memory_order_acquire); }

      private:
        /**
         * @brief Check the configured languages.
         *
         * Blank entries can never be matched; they are rejected in strict mode
         * and reported otherwise.
         */
        void validate() const;

      private:
        /** @brief Configuration parameters. */
        negotiator_cfg_t m_cfg{};

        /** @brief Set once init() succeeds. */
        std::atomic_bool m_initialized{};
    };
}

#endif // ACCEPTLANG_HXX
