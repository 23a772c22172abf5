/**
 * @file internal.hxx
 * @brief Internal HTTP helpers, including case-insensitive header name ordering.
 */

#ifndef ACCEPTLANG_HTTP_UTILS_INTERNAL_HXX
#define ACCEPTLANG_HTTP_UTILS_INTERNAL_HXX

/**
 * @brief Internal namespace for HTTP helpers.
 */
namespace acceptlang::http::internal {
    /**
     * @brief Case-insensitive, transparent comparator for header names.
     */
    struct ci_less_t {
        /** @brief Enables heterogeneous lookup with string views. */
        using is_transparent = void;

        /**
         * @brief Compare two names case-insensitively.
         * @param lhs Left-hand side name.
         * @param rhs Right-hand side name.
         * @return True if lhs orders before rhs ignoring case.
         */
        ACCEPTLANG_INLINE bool operator()(const std::string_view& lhs, const std::string_view& rhs) const {
            return boost::algorithm::ilexicographical_compare(lhs, rhs);
        }
    };
}

#endif // ACCEPTLANG_HTTP_UTILS_INTERNAL_HXX
