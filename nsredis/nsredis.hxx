/**
 * @file nsredis.hxx
 * @brief Main public API of nsredis: namespaced Redis clients over a shared connection pool.
 */

#ifndef NSREDIS_HXX
#define NSREDIS_HXX

#include "shared/shared.hxx"

#include "exception/exception.hxx"

#include "redis/redis.hxx"

#include "redis/lock/lock.hxx"

#include "manager/manager.hxx"

#include "client/client.hxx"

/**
 * @namespace nsredis
 * @brief Main namespace for nsredis.
 */
namespace nsredis {
    /** @brief Alias for the shared logging implementation. */
    using c_logging = shared::c_logging;

    /** @brief Alias for the shared logging level enumeration. */
    using e_log_level = shared::e_log_level;

    /** @brief Alias for the connection manager. */
    using c_connection_manager = manager::c_connection_manager;

    /** @brief Alias for the namespaced client. */
    using c_namespaced_client = client::c_namespaced_client;

    /** @brief Alias for the subscription cancellation token. */
    using c_cancellation_token = client::c_cancellation_token;
}

#endif // NSREDIS_HXX
