/**
 * @file exception.hxx
 * @brief Defines the exception hierarchy used throughout nsredis.
 *
 * Provides a base exception class (`base_exception_t`) derived from `std::runtime_error`,
 * and the specialized exception types raised by the connection pool, the namespace lock
 * and the namespaced client. Low-level store commands do not throw; they report
 * `boost::system::error_code` values which the client turns into these exceptions
 * according to its error policy.
 */

#ifndef NSREDIS_EXCEPTION_HXX
#define NSREDIS_EXCEPTION_HXX

namespace nsredis {
    /**
     * @brief Base exception type for all errors in nsredis.
     *
     * Inherits from std::runtime_error and provides status code handling,
     * optional message prefixes, and full error formatting.
     */
    struct base_exception_t : public std::runtime_error {
        /**
         * @brief Construct a base exception with a plain message.
         * @param str Error message.
         */
        NSREDIS_INLINE base_exception_t(const std::string& str)
            : std::runtime_error(str), m_message(str), m_what(str) {
        }

        /**
         * @brief Construct a base exception with a message, status code, and optional prefix.
         * @param str Error message.
         * @param status Associated status code.
         * @param prefix Optional prefix to include in the formatted message.
         */
        NSREDIS_INLINE base_exception_t(const std::string& str, const std::int32_t& status, const std::string_view& prefix = "")
            : std::runtime_error(str), m_status(status), m_prefix(prefix), m_message(str) {
            if (!m_prefix.empty()) {
                m_what = fmt::format("[{}] {}", m_prefix, m_message);
            }
            else
                m_what = m_message;
        }

      public:
        /**
         * @brief Status code associated with the exception (mutable).
         * @note For store errors this is the value of the underlying error code.
         */
        NSREDIS_INLINE auto& status() { return m_status; }

        /**
         * @brief Status code associated with the exception (read-only).
         */
        NSREDIS_INLINE const auto& status() const { return m_status; }

        /**
         * @brief Message prefix (mutable).
         */
        NSREDIS_INLINE auto& prefix() { return m_prefix; }

        /**
         * @brief Message prefix (read-only).
         */
        NSREDIS_INLINE const auto& prefix() const { return m_prefix; }

        /**
         * @brief Message without prefix (mutable).
         */
        NSREDIS_INLINE auto& message() { return m_message; }

        /**
         * @brief Message without prefix (read-only).
         */
        NSREDIS_INLINE const auto& message() const { return m_message; }

        /**
         * @brief Get the full formatted error message.
         */
        NSREDIS_INLINE const char* what() const noexcept override { return m_what.c_str(); }

      private:
        /** @brief Status code associated with the exception. */
        std::int32_t m_status{};

        /** @brief Prefix used to qualify the error message. */
        std::string m_prefix{};

        /** @brief Raw message content (without prefix). */
        std::string m_message{};

        /** @brief Cached full message string used in what(). */
        std::string m_what{};
    };

    namespace exceptions {
        /**
         * @brief The store is unreachable, the pool is exhausted or already closed.
         */
        struct connection_exception_t : public base_exception_t {
            NSREDIS_INLINE connection_exception_t(
                const std::string& str,

                const std::int32_t& status = 0,
                const std::string_view& prefix = "Connection"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief A store command failed and the client propagates errors.
         */
        struct operation_exception_t : public base_exception_t {
            NSREDIS_INLINE operation_exception_t(
                const std::string& str,

                const std::int32_t& status = 0,
                const std::string_view& prefix = "Operation"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief An operation was invoked on a client that is not ready.
         */
        struct not_initialized_exception_t : public base_exception_t {
            NSREDIS_INLINE not_initialized_exception_t(
                const std::string& str,

                const std::int32_t& status = 0,
                const std::string_view& prefix = "Not-Initialized"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief The namespace lock could not be acquired or released.
         */
        struct lock_exception_t : public base_exception_t {
            NSREDIS_INLINE lock_exception_t(
                const std::string& str,

                const std::int32_t& status = 0,
                const std::string_view& prefix = "Lock"
            )
                : base_exception_t(str, status, prefix) {
            }
        };

        /**
         * @brief Invalid configuration, e.g. a malformed connection URL.
         */
        struct config_exception_t : public base_exception_t {
            NSREDIS_INLINE config_exception_t(
                const std::string& str,

                const std::int32_t& status = 0,
                const std::string_view& prefix = "Config"
            )
                : base_exception_t(str, status, prefix) {
            }
        };
    }
}

#endif // NSREDIS_EXCEPTION_HXX
