/**
 * @file test_concurrency.cpp
 * @brief Concurrent use of shared decoders and the decoder registry
 */

#include <gtest/gtest.h>
#include <configs/configs.hpp>

#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <vector>

using namespace configs;
using namespace configs::decoder;

namespace {

struct Worker {
    std::string name;
    int threads;
    std::vector<std::string> queues;
};

struct Pool {
    std::map<std::string, Worker> workers;
    int capacity = 0;
};

ConfigNode make_tree(int index) {
    ConfigNode::Sequence queues;
    queues.push_back(ConfigNode::string("q" + std::to_string(index)));

    ConfigNode::Object worker;
    worker.emplace("name", ConfigNode::string("w" + std::to_string(index)));
    worker.emplace("threads", ConfigNode::integer(index));
    worker.emplace("queues", ConfigNode::sequence(std::move(queues)));

    ConfigNode::Object workers;
    workers.emplace("main", ConfigNode::object(std::move(worker)));

    ConfigNode::Object pool;
    pool.emplace("workers", ConfigNode::object(std::move(workers)));
    pool.emplace("capacity", ConfigNode::integer(index * 10));
    return ConfigNode::object(std::move(pool));
}

}  // namespace

template<>
struct configs::decoder::DecoderTraits<Worker> {
    static Decoder<Worker> make() {
        return ProductDecoderBuilder<Worker>("Worker")
            .primary(factory<Worker>(
                [](std::string name, int threads, std::vector<std::string> queues) {
                    return Worker{std::move(name), threads, std::move(queues)};
                },
                param<std::string>("name"), param<int>("threads"),
                param<std::vector<std::string>>("queues").with_default({})))
            .build();
    }
};

template<>
struct configs::decoder::DecoderTraits<Pool> {
    static Decoder<Pool> make() {
        return BeanDecoderBuilder<Pool>("Pool")
            .property("workers", &Pool::workers)
            .property("capacity", &Pool::capacity)
            .build();
    }
};

// ============================================================================
// Concurrent Decoding
// ============================================================================

class ConcurrencyTest : public ::testing::Test {
protected:
    static constexpr int THREADS    = 8;
    static constexpr int ITERATIONS = 200;
};

TEST_F(ConcurrencyTest, FirstUseFromManyThreads) {
    std::atomic<int> ready{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([t, &ready, &failures] {
            ready.fetch_add(1);
            while (ready.load() < THREADS) {
                std::this_thread::yield();
            }
            auto pool = extract<Pool>(make_tree(t + 1));
            if (pool.is_failure() || pool.value().capacity != (t + 1) * 10) {
                failures.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConcurrencyTest, SharedDecoderIsReentrant) {
    const auto decoder = decoder_of<Pool>();
    std::vector<ConfigNode> trees;
    for (int i = 0; i < THREADS; ++i) {
        trees.push_back(make_tree(i + 1));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < ITERATIONS; ++i) {
                const auto& tree = trees[(t + i) % THREADS];
                auto pool        = decoder.extract(tree);
                int expected     = (t + i) % THREADS + 1;
                if (pool.is_failure() ||
                    pool.value().workers.at("main").threads != expected ||
                    pool.value().workers.at("main").queues.size() != 1) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
}

TEST_F(ConcurrencyTest, FailuresAreIndependent) {
    const auto decoder = decoder_of<Worker>();
    std::atomic<int> wrong{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t] {
            ConfigNode::Object fields;
            fields.emplace("name", ConfigNode::string("w"));
            if (t % 2 == 0) {
                fields.emplace("threads", ConfigNode::string("many"));
            } else {
                fields.emplace("threads", ConfigNode::integer(t));
            }
            auto tree = ConfigNode::at_key("w" + std::to_string(t),
                                           ConfigNode::object(std::move(fields)));
            std::string path = "w" + std::to_string(t);
            for (int i = 0; i < ITERATIONS; ++i) {
                auto r = decoder.get(tree, path);
                bool ok_shape = (t % 2 == 0)
                                    ? (r.kind() == ErrorKind::WRONG_TYPE &&
                                       r.error().path() == path + ".threads")
                                    : (r.is_success() && r.value().threads == t);
                if (!ok_shape) {
                    wrong.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(wrong.load(), 0);
}
