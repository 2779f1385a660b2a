#include <nsredis.hxx>

namespace nsredis::client {
    c_cancellation_token::c_cancellation_token() : m_state(std::make_shared<state_t>()) {}

    void c_cancellation_token::cancel() {
        if (m_state->m_cancelled.exchange(true))
            return;

        std::lock_guard<std::mutex> lock(m_state->m_mutex);

        if (!m_state->m_executor.has_value())
            return;

        boost::asio::post(
            m_state->m_executor.value(),

            [state = m_state]() { state->m_signal.emit(boost::asio::cancellation_type::terminal); }
        );
    }

    bool c_cancellation_token::cancelled() const {
        return m_state->m_cancelled.load();
    }

    boost::asio::cancellation_slot c_cancellation_token::bind(const boost::asio::any_io_executor& executor) {
        std::lock_guard<std::mutex> lock(m_state->m_mutex);

        m_state->m_executor = executor;

        return m_state->m_signal.slot();
    }

    void c_cancellation_token::unbind() {
        std::lock_guard<std::mutex> lock(m_state->m_mutex);

        m_state->m_executor.reset();
    }
}
