/**
 * @file request.hxx
 * @brief Minimal view of an incoming HTTP request.
 *
 * Only the header map is kept: it is the single source of the raw
 * Accept-Language value handed to the parser.
 */

#ifndef ACCEPTLANG_HTTP_REQUEST_HXX
#define ACCEPTLANG_HTTP_REQUEST_HXX

namespace acceptlang::http {
    /**
     * @brief Represents the headers of an incoming HTTP request.
     */
    struct request_t {
        ACCEPTLANG_INLINE request_t() = default;

        /**
         * @brief Construct a request from an existing header map.
         * @param headers Request headers.
         */
        ACCEPTLANG_INLINE explicit request_t(headers_t headers) : m_headers(std::move(headers)) {}

      public:
        /**
         * @brief Look up a header value by name, ignoring case.
         * @param name Header name.
         * @return The header value, or nullopt if the header is not present.
         */
        [[nodiscard]] ACCEPTLANG_INLINE std::optional<std::string_view> header(const std::string_view& name) const {
            const auto it = m_headers.find(name);

            if (it == m_headers.end())
                return std::nullopt;

            return std::string_view{it->second};
        }

        /**
         * @brief Raw Accept-Language value of this request.
         * @return The header value, or an empty view if the header is missing or blank.
         */
        [[nodiscard]] ACCEPTLANG_INLINE std::string_view accept_language() const {
            const auto value = header(k_accept_language);

            if (!value.has_value()
                || boost::algorithm::all(*value, boost::algorithm::is_space()))
                return {};

            return *value;
        }

      public:
        /**
         * @brief Get the header map (mutable).
         * @return Reference to the headers container.
         */
        ACCEPTLANG_INLINE auto& headers() { return m_headers; }

        /**
         * @brief Get the header map (read-only).
         * @return Const reference to the headers container.
         */
        [[nodiscard]] ACCEPTLANG_INLINE const auto& headers() const { return m_headers; }

      private:
        /** @brief HTTP headers. */
        headers_t m_headers{};
    };
}

#endif // ACCEPTLANG_HTTP_REQUEST_HXX
