/**
 * @file logging.hxx
 * @brief Asynchronous buffered logger used by the negotiation components.
 */

#ifndef ACCEPTLANG_SHARED_LOGGING_HXX
#define ACCEPTLANG_SHARED_LOGGING_HXX

#define ACCEPTLANG_HAS_LOGGING_IMPL

namespace shared {
#ifdef ACCEPTLANG_USE_LOGGING_IMPL
    /**
     * @brief Log severity levels.
     */
    enum struct e_log_level : std::int16_t {
        debug,    ///< Debug-level messages.
        info,     ///< Informational messages.
        warning,  ///< Warning conditions.
        error,    ///< Error conditions.
        critical, ///< Critical conditions.
        none = -1 ///< Logging disabled.
    };

    /**
     * @brief A formatted log record waiting to be printed.
     */
    struct log_message_t {
        /** @brief Severity level of the record. */
        e_log_level m_level{};

        /** @brief Formatted text. */
        std::string m_message{};

        /** @brief Time the record was produced. */
        std::chrono::system_clock::time_point m_timestamp{};
    };

    /**
     * @brief Bounded FIFO of log records shared between producers and the writer thread.
     */
    class log_buffer_t {
      public:
        /**
         * @brief Construct a buffer holding at most @p capacity records.
         * @param capacity Maximum number of buffered records.
         */
        ACCEPTLANG_INLINE log_buffer_t(std::size_t capacity = 4096u) : m_capacity(capacity) {}

      public:
        /**
         * @brief Append a record.
         * @param msg Record to append.
         * @return False if the buffer is full and the record was not taken.
         */
        ACCEPTLANG_INLINE bool push(log_message_t&& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_records.size() >= m_capacity)
                return false;

            m_records.push_back(std::move(msg));

            return true;
        }

        /**
         * @brief Take the oldest record.
         * @param msg Receives the record.
         * @return False if the buffer was empty.
         */
        ACCEPTLANG_INLINE bool pop(log_message_t& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_records.empty())
                return false;

            msg = std::move(m_records.front());

            m_records.pop_front();

            return true;
        }

        /**
         * @brief Take up to @p batch_size of the oldest records in one step.
         * @param batch_size Maximum number of records to take.
         * @return Records in arrival order.
         */
        ACCEPTLANG_INLINE std::vector<log_message_t> get_batch(std::size_t batch_size) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            const auto count = std::min(batch_size, m_records.size());

            std::vector<log_message_t> batch{};

            batch.reserve(count);

            for (std::size_t i{}; i < count; i++) {
                batch.push_back(std::move(m_records.front()));

                m_records.pop_front();
            }

            return batch;
        }

        [[nodiscard]] ACCEPTLANG_INLINE std::size_t size() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_records.size();
        }

        [[nodiscard]] ACCEPTLANG_INLINE bool empty() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_records.empty();
        }

        [[nodiscard]] ACCEPTLANG_INLINE std::size_t capacity() const { return m_capacity; }

      private:
        /** @brief Pending records, oldest first. */
        std::deque<log_message_t> m_records{};

        /** @brief Guards m_records. */
        mutable std::shared_mutex m_mutex{};

        /** @brief Maximum number of pending records. */
        std::size_t m_capacity{};
    };

    /**
     * @brief Logger with level filtering and an optional background writer.
     *
     * In synchronous mode every accepted record is printed on the calling thread.
     * After start_async() records are queued in a log_buffer_t and printed in
     * batches by a worker thread; stop_async() drains whatever is left.
     */
    class c_logging {
      public:
        /**
         * @brief Construct a logger.
         * @param log_level Minimum severity level to print.
         * @param force_flush Flush stdout after every synchronous record.
         */
        ACCEPTLANG_INLINE c_logging(const e_log_level& log_level = e_log_level::none, bool force_flush = false)
            : m_log_level(log_level), m_force_flush(force_flush) {
        }

        ACCEPTLANG_INLINE ~c_logging() { stop_async(); }

        c_logging(const c_logging&) = delete;

        c_logging& operator=(const c_logging&) = delete;

      public:
        /**
         * @brief What to do with a record when the async buffer is full.
         */
        enum struct e_overflow_strategy {
            block,          ///< Wait for the writer to make room.
            discard_oldest, ///< Drop the oldest queued record.
            discard_newest  ///< Drop the incoming record.
        };

        /**
         * @brief Apply a configuration and optionally start the writer thread.
         * @param log_level Minimum severity level to print.
         * @param force_flush Flush stdout after every synchronous record.
         * @param async Start the background writer.
         * @param buffer_size Capacity of the async buffer.
         * @param strategy Overflow strategy for the async buffer.
         */
        ACCEPTLANG_INLINE void init(
            const e_log_level& log_level,

            bool force_flush = false,
            bool async = true,

            std::size_t buffer_size = 16384u,

            e_overflow_strategy strategy = e_overflow_strategy::discard_oldest
        ) {
            m_log_level.store(log_level, std::memory_order_release);

            m_force_flush.store(force_flush, std::memory_order_release);
            m_overflow_strategy.store(strategy, std::memory_order_release);

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                m_buffer_size = buffer_size;
            }

            if (async)
                start_async();
        }

        ACCEPTLANG_INLINE const char* lvl_to_str(const e_log_level& level) const {
            switch (level) {
                case e_log_level::debug:
                    return "DEBUG";
                case e_log_level::info:
                    return "INFO";
                case e_log_level::warning:
                    return "WARNING";
                case e_log_level::error:
                    return "ERROR";
                case e_log_level::critical:
                    return "CRITICAL";
                default:
                    return "UNKNOWN";
            }
        }

        /**
         * @brief Check whether a record of the given level would be printed.
         * @param level Severity level to test.
         * @return True if the level passes the filter.
         */
        [[nodiscard]] ACCEPTLANG_INLINE bool enabled(const e_log_level& level) const {
            const auto current = m_log_level.load(std::memory_order_acquire);

            return current != e_log_level::none && level >= current;
        }

        /**
         * @brief Current minimum severity level.
         */
        [[nodiscard]] ACCEPTLANG_INLINE e_log_level level() const { return m_log_level.load(std::memory_order_acquire); }

        /**
         * @brief Whether the background writer is running.
         */
        [[nodiscard]] ACCEPTLANG_INLINE bool running() const { return m_running.load(std::memory_order_acquire); }

        /**
         * @brief Print a record immediately, ignoring the level filter and the async buffer.
         * @tparam _args_t Format argument types.
         * @param log_level Severity level of the record.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        ACCEPTLANG_INLINE void force_log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            write({log_level, fmt::format(message, std::forward<_args_t>(args)...), std::chrono::system_clock::now()});

            std::fflush(stdout);
        }

        /**
         * @brief Format and emit a record if its level passes the filter.
         * @tparam _args_t Format argument types.
         * @param log_level Severity level of the record.
         * @param message Format string.
         * @param args Format arguments.
         */
        template <typename... _args_t>
        ACCEPTLANG_INLINE void log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            if (!enabled(log_level))
                return;

            log_message_t record{log_level, fmt::format(message, std::forward<_args_t>(args)...), std::chrono::system_clock::now()};

            if (const auto buffer = async_buffer()) {
                if (buffer->push(std::move(record)))
                    m_condition.notify_one();
                else
                    handle_overflow(buffer, std::move(record));

                return;
            }

            write(record);

            if (m_force_flush.load(std::memory_order_acquire))
                std::fflush(stdout);
        }

        /**
         * @brief Start the background writer thread.
         */
        ACCEPTLANG_INLINE void start_async() {
            std::lock_guard<std::mutex> lock(m_mutex);

            if (m_running.load(std::memory_order_acquire))
                return;

            m_log_buffer = std::make_shared<log_buffer_t>(m_buffer_size);

            m_running.store(true, std::memory_order_release);

            m_worker_thread = std::thread(&c_logging::process_logs, this);
        }

        /**
         * @brief Stop the background writer and print every record still queued.
         */
        ACCEPTLANG_INLINE void stop_async() {
            std::thread worker{};

            std::shared_ptr<log_buffer_t> buffer{};

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                if (!m_running.load(std::memory_order_acquire))
                    return;

                m_running.store(false, std::memory_order_release);

                worker = std::move(m_worker_thread);

                buffer = std::move(m_log_buffer);
            }

            m_condition.notify_all();

            if (worker.joinable())
                worker.join();

            if (!buffer)
                return;

            for (const auto& record : buffer->get_batch(buffer->size()))
                write(record);

            std::fflush(stdout);
        }

      private:
        /**
         * @brief Async buffer if the writer is running.
         * @return Shared handle that stays valid across a concurrent stop_async(), or nullptr.
         */
        ACCEPTLANG_INLINE std::shared_ptr<log_buffer_t> async_buffer() {
            if (!m_running.load(std::memory_order_acquire))
                return nullptr;

            std::lock_guard<std::mutex> lock(m_mutex);

            return m_log_buffer;
        }

        /**
         * @brief Print one record to stdout.
         * @param record Record to print.
         */
        ACCEPTLANG_INLINE void write(const log_message_t& record) const {
            const auto seconds = std::chrono::system_clock::from_time_t(std::chrono::system_clock::to_time_t(record.m_timestamp));

            fmt::print(
                "[{:%Y-%m-%d %H:%M:%S}] {} - {}\n",

                fmt::styled(seconds, fmt::emphasis::bold | fg(fmt::rgb(245, 245, 184))),

                fmt::styled(lvl_to_str(record.m_level), fmt::emphasis::bold),

                fmt::styled(record.m_message, fg(fmt::rgb(255, 255, 230)))
            );
        }

        ACCEPTLANG_INLINE void handle_overflow(const std::shared_ptr<log_buffer_t>& buffer, log_message_t&& record) {
            switch (m_overflow_strategy.load(std::memory_order_acquire)) {
                case e_overflow_strategy::block:
                    {
                        std::unique_lock<std::mutex> lock(m_mutex);

                        m_condition.wait(lock, [this, &buffer] {
                            return !m_running.load(std::memory_order_acquire) || buffer->size() < buffer->capacity();
                        });

                        if (!m_running.load(std::memory_order_acquire)
                            || !buffer->push(std::move(record))) {
                            lock.unlock();

                            write(record);

                            break;
                        }

                        m_condition.notify_one();

                        break;
                    }

                case e_overflow_strategy::discard_oldest:
                    {
                        log_message_t dropped{};

                        if (buffer->pop(dropped) && buffer->push(std::move(record)))
                            m_condition.notify_one();

                        break;
                    }

                case e_overflow_strategy::discard_newest:
                    break;
            }
        }

        /**
         * @brief Writer thread body.
         */
        ACCEPTLANG_INLINE void process_logs() {
            constexpr std::size_t k_batch_size = 256u;

            std::shared_ptr<log_buffer_t> buffer{};

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                buffer = m_log_buffer;
            }

            if (!buffer)
                return;

            for (;;) {
                {
                    std::unique_lock<std::mutex> lock(m_mutex);

                    m_condition.wait_for(lock, std::chrono::milliseconds(50), [this, &buffer] {
                        return !m_running.load(std::memory_order_acquire) || !buffer->empty();
                    });

                    if (!m_running.load(std::memory_order_acquire))
                        break;
                }

                auto batch = buffer->get_batch(k_batch_size);

                if (batch.empty())
                    continue;

                for (const auto& record : batch)
                    write(record);

                std::fflush(stdout);

                m_condition.notify_all();
            }
        }

      private:
        /** @brief Minimum severity level to print. */
        std::atomic<e_log_level> m_log_level{e_log_level::none};

        /** @brief Flush stdout after every synchronous record. */
        std::atomic<bool> m_force_flush{};

        /** @brief Set while the writer thread runs. */
        std::atomic<bool> m_running{};

        /** @brief Async buffer, owned here while the writer runs and shared with producers mid-push. */
        std::shared_ptr<log_buffer_t> m_log_buffer{};

        /** @brief Guards m_log_buffer, m_worker_thread, m_buffer_size and the condition variable. */
        std::mutex m_mutex{};

        /** @brief Wakes the writer and blocked producers. */
        std::condition_variable m_condition{};

        /** @brief Background writer. */
        std::thread m_worker_thread{};

        /** @brief Capacity of the async buffer. */
        std::size_t m_buffer_size{16384u};

        /** @brief Overflow strategy for the async buffer. */
        std::atomic<e_overflow_strategy> m_overflow_strategy{e_overflow_strategy::discard_oldest};
    };
#endif // ACCEPTLANG_USE_LOGGING_IMPL
}

#endif // ACCEPTLANG_SHARED_LOGGING_HXX
