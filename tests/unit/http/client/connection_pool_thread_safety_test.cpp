#include <catch2/catch_test_macros.hpp>
#include <tether/http/client/connection_pool.hpp>
#include <tether/http/client/client_connection.hpp>
#include <fixtures/fake_network.hpp>
#include <fixtures/run_sync.hpp>
#include <boost/asio.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>
#include <random>
#include <mutex>
#include <set>

using namespace tether::http;
using tether::test::fake_socket;
using tether::test::run_sync;

TEST_CASE("Connection pool thread safety", "[client][pool][threading]") {
    // sockets only live on this context, it is never run
    boost::asio::io_context sockets_context;
    std::atomic<int> created{0};

    auto pool = std::make_shared<connection_pool>(
        [&](const request_key& key) -> tether::awaitable<std::shared_ptr<client_connection>> {
            ++created;
            co_return std::make_shared<client_connection>(std::make_shared<fake_socket>(sockets_context), key);
        });

    SECTION("Concurrent take/release operations are thread-safe") {
        std::atomic<int> total_operations{0};
        std::atomic<int> reused{0};
        std::atomic<int> wrong_key{0};
        const int num_threads = 8;
        const int operations_per_thread = 500;

        auto thread_func = [&](int thread_id) {
            boost::asio::io_context context;
            std::mt19937 gen(thread_id);
            std::uniform_int_distribution<> dis(0, 9);

            for (int i = 0; i < operations_per_thread; ++i) {
                request_key key("http", "host" + std::to_string(dis(gen)));
                auto managed = run_sync(context, pool->take(key));
                if (managed->key() != key) ++wrong_key;
                if (managed.is_reused()) ++reused;

                // most connections are handed back as reusable
                if (dis(gen) < 7) {
                    managed->set_reusable(reusable::reuse);
                }
                managed.release();
                ++total_operations;
            }
        };

        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back(thread_func, i);
        }
        for (auto& t : threads) {
            t.join();
        }

        REQUIRE(total_operations == num_threads * operations_per_thread);
        REQUIRE(wrong_key == 0);
        REQUIRE(reused > 0);
        REQUIRE(pool->leased() == 0);
        REQUIRE(pool->size() <= static_cast<size_t>(created.load()));
    }

    SECTION("A pooled connection is handed to a single holder at a time") {
        request_key key("http", "shared.host");
        std::atomic<int> holders{0};
        std::atomic<int> overlaps{0};
        std::mutex held_mutex;
        std::set<client_connection*> held;
        const int num_threads = 8;

        auto thread_func = [&]() {
            boost::asio::io_context context;
            for (int i = 0; i < 300; ++i) {
                auto managed = run_sync(context, pool->take(key));
                {
                    std::lock_guard<std::mutex> lock(held_mutex);
                    if (!held.insert(managed.get().get()).second) ++overlaps;
                }
                std::this_thread::yield();
                {
                    std::lock_guard<std::mutex> lock(held_mutex);
                    held.erase(managed.get().get());
                }
                managed->set_reusable(reusable::reuse);
                managed.release();
            }
            ++holders;
        };

        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back(thread_func);
        }
        for (auto& t : threads) {
            t.join();
        }

        REQUIRE(holders == num_threads);
        REQUIRE(overlaps == 0);
        REQUIRE(pool->leased() == 0);
        REQUIRE(pool->size(key) == static_cast<size_t>(created.load()));
    }

    SECTION("Maintenance runs concurrently with checkouts") {
        std::atomic<bool> stop{false};
        std::atomic<size_t> removed{0};

        std::thread cleanup_thread([&]() {
            while (!stop) {
                removed += pool->cleanup_closed();
                removed += pool->evict_idle(std::chrono::milliseconds{2});
                std::this_thread::sleep_for(std::chrono::milliseconds{1});
            }
        });

        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&, t]() {
                boost::asio::io_context context;
                for (int i = 0; i < 300; ++i) {
                    auto managed = run_sync(context, pool->take(request_key("http", "host" + std::to_string(i % 5))));
                    if ((i + t) % 3 == 0) {
                        managed->get_socket()->close();
                    }
                    managed->set_reusable(reusable::reuse);
                }
            });
        }
        for (auto& w : workers) {
            w.join();
        }
        stop = true;
        cleanup_thread.join();

        REQUIRE(pool->leased() == 0);
        pool->clear();
        REQUIRE(pool->size() == 0);
    }
}
