/**
 * @file http.hxx
 * @brief HTTP header types and names used to feed language negotiation.
 */

#ifndef ACCEPTLANG_HTTP_HXX
#define ACCEPTLANG_HTTP_HXX

#include "utils/internal/internal.hxx"

namespace acceptlang::http {
    /** @brief Type alias for HTTP headers (case-insensitive keys). */
    using headers_t = std::map<std::string, std::string, internal::ci_less_t>;

    /** @brief Request header carrying the client's language preferences. */
    inline constexpr std::string_view k_accept_language = "Accept-Language";

    /** @brief Response header naming the language of the selected content. */
    inline constexpr std::string_view k_content_language = "Content-Language";

    /** @brief Response header listing request headers the response varies on. */
    inline constexpr std::string_view k_vary = "Vary";
}

#include "request/request.hxx"

#endif // ACCEPTLANG_HTTP_HXX
