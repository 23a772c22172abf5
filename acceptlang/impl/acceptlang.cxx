#include <acceptlang.hxx>

namespace acceptlang {
    void c_negotiator::init(negotiator_cfg_t cfg) {
        m_initialized.store(false, std::memory_order_release);

        m_cfg = std::move(cfg);

#ifdef ACCEPTLANG_USE_LOGGING_IMPL
        g_logging->init(
            m_cfg.m_logger.m_level,
            m_cfg.m_logger.m_force_flush,
            m_cfg.m_logger.m_async,
            m_cfg.m_logger.m_buffer_size,
            m_cfg.m_logger.m_strategy
        );
#endif // ACCEPTLANG_USE_LOGGING_IMPL

        validate();

        m_initialized.store(true, std::memory_order_release);

#ifdef ACCEPTLANG_USE_LOGGING_IMPL
        g_logging->log(
            e_log_level::info,

            "[Negotiator] Serving {} language(s): [{}], default '{}'",

            m_cfg.m_available.size(), fmt::join(m_cfg.m_available, ", "), m_cfg.m_default.value_or("")
        );
#endif // ACCEPTLANG_USE_LOGGING_IMPL
    }

    void c_negotiator::validate() const {
        for (std::size_t i{}; i < m_cfg.m_available.size(); i++) {
            if (!locale::normalize(m_cfg.m_available[i]).empty())
                continue;

            if (m_cfg.m_strict)
                throw exceptions::config_exception_t(fmt::format("Available language #{} is blank", i));

#ifdef ACCEPTLANG_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Negotiator] Available language #{} is blank and will never match", i);
#endif // ACCEPTLANG_USE_LOGGING_IMPL
        }

        if (m_cfg.m_default.has_value()
            && locale::normalize(*m_cfg.m_default).empty()) {
            if (m_cfg.m_strict)
                throw exceptions::config_exception_t("Default language is blank");

#ifdef ACCEPTLANG_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Negotiator] Default language is blank");
#endif // ACCEPTLANG_USE_LOGGING_IMPL
        }

        if (m_cfg.m_available.empty()) {
#ifdef ACCEPTLANG_USE_LOGGING_IMPL
            g_logging->log(e_log_level::warning, "[Negotiator] No available languages configured, every request gets the default");
#endif // ACCEPTLANG_USE_LOGGING_IMPL
        }
    }

    negotiation_t c_negotiator::negotiate(const std::string_view& header) const {
        if (!initialized())
            throw base_exception_t("Negotiator used before init()", e_error::not_initialized, "Negotiator");

        negotiation_t ret{};

        ret.m_language = accept_language_t::get_best_match(header, m_cfg.m_available, m_cfg.m_default);

        if (ret.m_language.has_value())
            ret.m_quality = accept_language_t::get_quality(header, *ret.m_language);

        ret.m_rtl = accept_language_t::is_rtl(header);

        ret.m_preferences = accept_language_t::get_all(header);

#ifdef ACCEPTLANG_USE_LOGGING_IMPL
        if (g_logging->enabled(e_log_level::debug)) {
            g_logging->log(
                e_log_level::debug,

                "[Negotiator] Accept-Language '{}' -> '{}' (rtl: {})",

                accept_language_t::to_string(accept_language_t::parse(header)), ret.m_language.value_or(""), ret.m_rtl
            );
        }
#endif // ACCEPTLANG_USE_LOGGING_IMPL

        return ret;
    }

    negotiation_t c_negotiator::negotiate(const http::request_t& request) const {
        return negotiate(request.accept_language());
    }

    void c_negotiator::apply(const negotiation_t& negotiation, http::headers_t& headers) {
        if (negotiation.m_language.has_value()) {
            auto language = locale::normalize(*negotiation.m_language);

            if (!language.empty())
                headers.insert_or_assign(std::string{http::k_content_language}, std::move(language));
        }

        const auto it = headers.find(http::k_vary);

        if (it == headers.end()) {
            headers.emplace(std::string{http::k_vary}, std::string{http::k_accept_language});

            return;
        }

        std::vector<std::string> varies{};

        boost::algorithm::split(varies, it->second, boost::algorithm::is_any_of(","));

        for (auto& vary : varies) {
            boost::algorithm::trim(vary);

            if (vary == "*" || boost::algorithm::iequals(vary, http::k_accept_language))
                return;
        }

        it->second = it->second.empty()
                         ? std::string{http::k_accept_language}
                         : fmt::format("{}, {}", it->second, http::k_accept_language);
    }
}
