#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <string>

namespace reposcope::engine {

    /**
     * @brief A file read by the scanner and waiting to be chunked. slot is its position in discovery order.
     */
    struct FileJob {
        size_t slot = 0;
        std::string relative_path;
        std::string content;
    };

    class JobQueue {
    public:
        void push(FileJob job) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(job));
            }
            m_cv.notify_one();
        }

        /**
         * @brief Blocks until a job is available or the queue is stopped and drained.
         * @return false once stopped and empty.
         */
        bool pop(FileJob& job) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            job = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

        /**
         * @brief Drops every queued job; workers see an empty queue.
         */
        void clear() {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::queue<FileJob>().swap(m_queue);
        }

    private:
        std::queue<FileJob> m_queue;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stop = false;
    };

}
