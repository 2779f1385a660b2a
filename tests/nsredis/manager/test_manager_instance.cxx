#include <gtest/gtest.h>

#include <nsredis.hxx>

using namespace nsredis;

namespace {
    boost::asio::io_context& shared_io_ctx() {
        static boost::asio::io_context s_io_ctx;

        return s_io_ctx;
    }

    manager::manager_cfg_t make_cfg(std::int32_t db, std::string host = "127.0.0.1", std::string port = "6379") {
        manager::manager_cfg_t cfg{};

        {
            cfg.m_pool.m_host = std::move(host);
            cfg.m_pool.m_port = std::move(port);
            cfg.m_pool.m_db = db;

            cfg.m_logger.m_level = shared::e_log_level::error;
            cfg.m_logger.m_async = false;
        }

        return cfg;
    }
}

TEST(ManagerInstanceTest, FirstCallWins) {
    auto first = manager::c_connection_manager::instance(shared_io_ctx(), make_cfg(1));

    auto second = manager::c_connection_manager::instance(shared_io_ctx(), make_cfg(2));

    ASSERT_NE(first, nullptr);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first->get_pool(), second->get_pool());

    EXPECT_EQ(second->cfg().m_pool.m_db, 1);
    EXPECT_EQ(second->get_pool()->cfg().m_db, 1);

    auto third = manager::c_connection_manager::instance(shared_io_ctx(), make_cfg(1, "localhost", "6380"));

    EXPECT_EQ(third, first);
    EXPECT_EQ(third->get_pool(), first->get_pool());

    EXPECT_EQ(third->get_pool()->cfg().m_host, "127.0.0.1");
    EXPECT_EQ(third->get_pool()->cfg().m_port, "6379");
}

TEST(ManagerInstanceTest, ConcurrentFirstCallsShareOneManager) {
    std::vector<std::shared_ptr<manager::c_connection_manager>> managers(8u);

    std::vector<std::thread> threads{};

    for (std::size_t i{}; i < managers.size(); i++)
        threads.emplace_back([&managers, i]() { managers[i] = manager::c_connection_manager::instance(shared_io_ctx(), make_cfg(static_cast<std::int32_t>(i))); });

    for (auto& thread : threads)
        thread.join();

    for (const auto& manager : managers)
        EXPECT_EQ(manager, managers.front());
}
