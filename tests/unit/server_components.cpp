#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include "bytebeam/error_codes.hpp"
#include "bytebeam/server/reaper.hpp"
#include "bytebeam/server/session_registry.hpp"
#include "bytebeam/server/stream_cache.hpp"
#include "bytebeam/server/token_generator.hpp"
#include "bytebeam/server/transfer_session.hpp"

using namespace bytebeam;
using namespace bytebeam::server;
using namespace std::chrono_literals;
using protocol::TransferState;

namespace
{

    template <typename Predicate>
    void run_until(boost::asio::io_context &io, Predicate done, std::chrono::milliseconds limit = 10s)
    {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!done() && std::chrono::steady_clock::now() < deadline)
        {
            io.restart();
            io.run_for(5ms);
        }
        assert(done());
    }

    std::vector<std::uint8_t> make_payload(std::size_t size, std::uint32_t seed)
    {
        std::mt19937 engine(seed);
        std::vector<std::uint8_t> payload(size);
        for (auto &byte : payload)
        {
            byte = static_cast<std::uint8_t>(engine());
        }
        return payload;
    }

    // Writes a payload in fixed-size chunks, one write outstanding at a time.
    struct Producer
    {
        std::shared_ptr<CacheSlice> slice;
        boost::asio::any_io_executor executor;
        const std::vector<std::uint8_t> *payload{};
        std::size_t step{};
        std::function<void()> on_finished{};
        std::function<void(std::size_t)> on_progress{};

        std::size_t offset{0};
        std::size_t writes{0};
        std::atomic<bool> done{false};
        std::error_code error{};

        void next()
        {
            if (offset >= payload->size())
            {
                if (on_finished)
                {
                    on_finished();
                }
                else
                {
                    slice->close_writer(false);
                }
                done = true;
                return;
            }
            const auto size = std::min(step, payload->size() - offset);
            Chunk chunk(payload->begin() + static_cast<std::ptrdiff_t>(offset),
                        payload->begin() + static_cast<std::ptrdiff_t>(offset + size));
            offset += size;
            slice->async_write(std::move(chunk), executor, [this](std::error_code ec)
                               {
                if (ec)
                {
                    error = ec;
                    done = true;
                    return;
                }
                ++writes;
                if (on_progress)
                {
                    on_progress(writes);
                }
                next(); });
        }
    };

    struct Consumer
    {
        std::shared_ptr<CacheSlice> slice;
        boost::asio::any_io_executor executor;

        std::vector<std::uint8_t> received{};
        std::atomic<bool> done{false};
        std::error_code error{};

        void next()
        {
            slice->async_read(executor, [this](std::error_code ec, Chunk chunk)
                              {
                if (ec)
                {
                    error = ec;
                    done = true;
                    return;
                }
                if (chunk.empty())
                {
                    done = true;
                    return;
                }
                received.insert(received.end(), chunk.begin(), chunk.end());
                next(); });
        }
    };

    TokenGenerator &test_tokens()
    {
        static TokenGenerator tokens(builtin_wordlist());
        return tokens;
    }

    void test_token_generator()
    {
        const auto &words = builtin_wordlist();
        assert(words.size() >= 1024);
        const std::set<std::string> unique(words.begin(), words.end());
        assert(unique.size() == words.size());

        const auto &tokens = test_tokens();
        for (int i = 0; i < 50; ++i)
        {
            const auto token = tokens.generate("{number}-{word}-{word}-{word}");
            std::vector<std::string> parts;
            std::size_t start = 0;
            while (true)
            {
                const auto dash = token.find('-', start);
                parts.push_back(token.substr(start, dash - start));
                if (dash == std::string::npos)
                {
                    break;
                }
                start = dash + 1;
            }
            assert(parts.size() == 4);
            assert(std::stoi(parts[0]) >= 0 && std::stoi(parts[0]) < 100);
            for (std::size_t p = 1; p < parts.size(); ++p)
            {
                assert(unique.contains(parts[p]));
            }
        }
        assert(tokens.generate("{uuid}").size() == 36);
        assert(tokens.generate("fixed") == "fixed");

        bool threw = false;
        try
        {
            tokens.validate_format("{word}/{word}");
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        const TokenGenerator empty(std::vector<std::string>{});
        threw = false;
        try
        {
            empty.validate_format("{number}-{word}");
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
        empty.validate_format("{number}-{uuid}");

        const auto path = std::filesystem::temp_directory_path() / "bytebeam_wordlist_test.txt";
        {
            std::ofstream file(path);
            file << "  alpha \n\nbravo\r\n   \ncharlie\n";
        }
        const auto loaded = load_wordlist(path);
        assert(loaded.size() == 3);
        assert(loaded[0] == "alpha");
        assert(loaded[1] == "bravo");
        assert(loaded[2] == "charlie");
        std::filesystem::remove(path);

        threw = false;
        try
        {
            load_wordlist(std::filesystem::temp_directory_path() / "bytebeam_missing_wordlist.txt");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_cache_round_trip()
    {
        const auto payload = make_payload(50'000, 7);
        for (const std::size_t step : {std::size_t{7}, std::size_t{4096}, std::size_t{65'536}, payload.size()})
        {
            boost::asio::io_context io;
            CachePool pool(16 * 1024);
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            assert(!slice->attach_writer());
            assert(!slice->attach_reader());

            Producer producer{slice, io.get_executor(), &payload, step};
            Consumer consumer{slice, io.get_executor()};
            producer.next();
            consumer.next();
            run_until(io, [&]
                      { return producer.done && consumer.done; });

            assert(!producer.error);
            assert(!consumer.error);
            assert(consumer.received == payload);
            assert(slice->bytes_written() == payload.size());
            assert(slice->bytes_read() == payload.size());
            assert(pool.used() == 0);
            assert(pool.peak_used() <= pool.capacity());
        }
    }

    void test_upload_before_download()
    {
        boost::asio::io_context io;
        const auto payload = make_payload(20'000, 11);
        CachePool pool(64 * 1024);
        auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
        assert(!slice->attach_writer());

        Producer producer{slice, io.get_executor(), &payload, 1000};
        producer.next();
        run_until(io, [&]
                  { return producer.done.load(); });
        assert(!producer.error);
        assert(pool.used() == payload.size());

        assert(!slice->attach_reader());
        Consumer consumer{slice, io.get_executor()};
        consumer.next();
        run_until(io, [&]
                  { return consumer.done.load(); });
        assert(consumer.received == payload);
        assert(pool.used() == 0);
    }

    void test_attach_exclusivity()
    {
        for (int round = 0; round < 20; ++round)
        {
            CachePool pool(1024);
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            std::atomic<bool> go{false};
            std::atomic<int> writers{0};
            std::atomic<int> readers{0};
            std::atomic<int> rejected{0};

            std::vector<std::thread> threads;
            for (int i = 0; i < 8; ++i)
            {
                threads.emplace_back([&, i]
                                     {
                    while (!go)
                    {
                        std::this_thread::yield();
                    }
                    const auto ec = (i % 2 == 0) ? slice->attach_writer() : slice->attach_reader();
                    if (!ec)
                    {
                        ++((i % 2 == 0) ? writers : readers);
                    }
                    else
                    {
                        assert(ec == ErrorCode::AlreadyAttached);
                        ++rejected;
                    } });
            }
            go = true;
            for (auto &thread : threads)
            {
                thread.join();
            }
            assert(writers == 1);
            assert(readers == 1);
            assert(rejected == 6);
            assert(pool.active_writers() == 1);
        }
    }

    void test_capacity_invariant()
    {
        constexpr std::size_t kSlices = 4;
        boost::asio::io_context io;
        CachePool pool(64 * 1024);

        std::vector<std::vector<std::uint8_t>> payloads;
        std::vector<std::shared_ptr<CacheSlice>> slices;
        for (std::size_t i = 0; i < kSlices; ++i)
        {
            payloads.push_back(make_payload(400 * 1024 + i * 333, static_cast<std::uint32_t>(100 + i)));
            slices.push_back(std::make_shared<CacheSlice>(pool, SliceOptions{}));
            assert(!slices.back()->attach_writer());
            assert(!slices.back()->attach_reader());
        }

        std::vector<std::unique_ptr<Producer>> producers;
        std::vector<std::unique_ptr<Consumer>> consumers;
        for (std::size_t i = 0; i < kSlices; ++i)
        {
            producers.push_back(std::make_unique<Producer>());
            producers.back()->slice = slices[i];
            producers.back()->executor = io.get_executor();
            producers.back()->payload = &payloads[i];
            producers.back()->step = 3000 + i * 1111;
            consumers.push_back(std::make_unique<Consumer>());
            consumers.back()->slice = slices[i];
            consumers.back()->executor = io.get_executor();
        }

        auto work = boost::asio::make_work_guard(io);
        std::vector<std::thread> workers;
        for (int i = 0; i < 4; ++i)
        {
            workers.emplace_back([&io]
                                 { io.run(); });
        }

        std::atomic<bool> sampling{true};
        std::atomic<bool> violated{false};
        std::thread sampler([&]
                            {
            while (sampling)
            {
                if (pool.used() > pool.capacity())
                {
                    violated = true;
                }
                std::this_thread::yield();
            } });

        for (std::size_t i = 0; i < kSlices; ++i)
        {
            producers[i]->next();
            consumers[i]->next();
        }

        const auto deadline = std::chrono::steady_clock::now() + 30s;
        auto finished = [&]
        {
            return std::all_of(consumers.begin(), consumers.end(), [](const auto &c)
                               { return c->done.load(); });
        };
        while (!finished() && std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(5ms);
        }
        sampling = false;
        sampler.join();
        work.reset();
        io.stop();
        for (auto &worker : workers)
        {
            worker.join();
        }

        assert(finished());
        assert(!violated);
        assert(pool.peak_used() <= pool.capacity());
        assert(pool.used() == 0);
        for (std::size_t i = 0; i < kSlices; ++i)
        {
            assert(!producers[i]->error);
            assert(!consumers[i]->error);
            assert(consumers[i]->received == payloads[i]);
        }
    }

    void test_backpressure_and_capacity()
    {
        boost::asio::io_context io;
        CachePool pool(8 * 1024);
        auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
        assert(!slice->attach_writer());
        assert(!slice->attach_reader());

        std::vector<std::optional<std::error_code>> results(3);
        for (std::size_t i = 0; i < 2; ++i)
        {
            slice->async_write(Chunk(4096, static_cast<std::uint8_t>(i)), io.get_executor(),
                               [&results, i](std::error_code ec)
                               { results[i] = ec; });
            run_until(io, [&]
                      { return results[i].has_value(); });
            assert(!*results[i]);
        }
        assert(pool.used() == 8 * 1024);

        slice->async_write(Chunk(4096, 2), io.get_executor(), [&results](std::error_code ec)
                           { results[2] = ec; });
        io.restart();
        io.run_for(50ms);
        assert(!results[2]);
        assert(pool.used() == 8 * 1024);

        std::optional<Chunk> first;
        slice->async_read(io.get_executor(), [&first](std::error_code ec, Chunk chunk)
                          {
            assert(!ec);
            first = std::move(chunk); });
        run_until(io, [&]
                  { return first.has_value() && results[2].has_value(); });
        assert(first->size() == 4096 && (*first)[0] == 0);
        assert(!*results[2]);
        assert(pool.used() == 8 * 1024);

        std::optional<std::error_code> oversized;
        slice->async_write(Chunk(8 * 1024 + 1, 9), io.get_executor(), [&oversized](std::error_code ec)
                           { oversized = ec; });
        run_until(io, [&]
                  { return oversized.has_value(); });
        assert(*oversized == ErrorCode::CapacityExceeded);
    }

    void test_fair_share()
    {
        boost::asio::io_context io;
        CachePool pool(8 * 1024);
        auto a = std::make_shared<CacheSlice>(pool, SliceOptions{});
        auto b = std::make_shared<CacheSlice>(pool, SliceOptions{});
        assert(!a->attach_writer());
        assert(!b->attach_writer());

        int admitted = 0;
        for (int i = 0; i < 3; ++i)
        {
            a->async_write(Chunk(2048, 1), io.get_executor(), [&admitted](std::error_code ec)
                           {
                assert(!ec);
                ++admitted; });
            io.restart();
            io.run_for(20ms);
        }
        // Two attached writers: slice a may hold 4 KiB while b has nothing.
        assert(admitted == 2);
        assert(a->occupied() == 4096);

        std::optional<std::error_code> b_result;
        b->async_write(Chunk(4096, 2), io.get_executor(), [&b_result](std::error_code ec)
                       { b_result = ec; });
        run_until(io, [&]
                  { return b_result.has_value(); });
        assert(!*b_result);

        // Detaching b restores a's full share and wakes its parked write.
        assert(b->close_writer(false));
        b->close_reader();
        run_until(io, [&]
                  { return admitted == 3; });
        assert(a->occupied() == 6144);
    }

    void test_stall_timeouts()
    {
        boost::asio::io_context io;
        CachePool pool(4096);
        SliceOptions options{};
        options.write_timeout = 50ms;
        options.read_timeout = 50ms;
        auto slice = std::make_shared<CacheSlice>(pool, options);
        assert(!slice->attach_writer());
        assert(!slice->attach_reader());

        std::optional<std::error_code> read_result;
        slice->async_read(io.get_executor(), [&read_result](std::error_code ec, Chunk)
                          { read_result = ec; });
        run_until(io, [&]
                  { return read_result.has_value(); });
        assert(*read_result == ErrorCode::Stalled);

        std::optional<std::error_code> first;
        std::optional<std::error_code> second;
        slice->async_write(Chunk(4096, 1), io.get_executor(), [&first](std::error_code ec)
                           { first = ec; });
        run_until(io, [&]
                  { return first.has_value(); });
        assert(!*first);
        slice->async_write(Chunk(10, 2), io.get_executor(), [&second](std::error_code ec)
                           { second = ec; });
        run_until(io, [&]
                  { return second.has_value(); });
        assert(*second == ErrorCode::Stalled);

        // A stall fails only that attempt.
        assert(!slice->aborted());
        std::optional<Chunk> drained;
        slice->async_read(io.get_executor(), [&drained](std::error_code ec, Chunk chunk)
                          {
            assert(!ec);
            drained = std::move(chunk); });
        run_until(io, [&]
                  { return drained.has_value(); });
        assert(drained->size() == 4096);

        std::optional<std::error_code> third;
        slice->async_write(Chunk(10, 3), io.get_executor(), [&third](std::error_code ec)
                           { third = ec; });
        run_until(io, [&]
                  { return third.has_value(); });
        assert(!*third);
    }

    void test_read_stall_waits_for_producer()
    {
        boost::asio::io_context io;
        CachePool pool(4096);
        SliceOptions options{};
        options.read_timeout = 50ms;
        auto slice = std::make_shared<CacheSlice>(pool, options);
        assert(!slice->attach_reader());

        // A consumer that arrives first waits for the producer without a deadline.
        std::optional<std::error_code> first;
        Chunk received;
        slice->async_read(io.get_executor(), [&](std::error_code ec, Chunk chunk)
                          {
            first = ec;
            received = std::move(chunk); });
        io.restart();
        io.run_for(200ms);
        assert(!first);

        assert(!slice->attach_writer());
        std::optional<std::error_code> written;
        slice->async_write(Chunk(64, 7), io.get_executor(), [&written](std::error_code ec)
                           { written = ec; });
        run_until(io, [&]
                  { return first.has_value() && written.has_value(); });
        assert(!*first);
        assert(!*written);
        assert(received.size() == 64);

        // With a producer attached an idle stream stalls the consumer.
        std::optional<std::error_code> second;
        slice->async_read(io.get_executor(), [&second](std::error_code ec, Chunk)
                          { second = ec; });
        run_until(io, [&]
                  { return second.has_value(); });
        assert(*second == ErrorCode::Stalled);

        // A read parked before the producer attached gets its deadline on attach.
        auto late = std::make_shared<CacheSlice>(pool, options);
        assert(!late->attach_reader());
        std::optional<std::error_code> parked;
        late->async_read(io.get_executor(), [&parked](std::error_code ec, Chunk)
                         { parked = ec; });
        io.restart();
        io.run_for(100ms);
        assert(!parked);
        assert(!late->attach_writer());
        run_until(io, [&]
                  { return parked.has_value(); });
        assert(*parked == ErrorCode::Stalled);
    }

    void test_abort_semantics()
    {
        boost::asio::io_context io;
        CachePool pool(64 * 1024);

        {
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            assert(!slice->attach_writer());
            assert(!slice->attach_reader());
            std::optional<std::error_code> read_result;
            slice->async_read(io.get_executor(), [&read_result](std::error_code ec, Chunk)
                              { read_result = ec; });
            io.restart();
            io.run_for(10ms);
            assert(!read_result);
            assert(!slice->close_writer(true));
            run_until(io, [&]
                      { return read_result.has_value(); });
            assert(*read_result == ErrorCode::Aborted);
        }

        {
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            slice->set_expected_size(10);
            assert(!slice->attach_writer());
            assert(!slice->attach_reader());
            std::optional<std::error_code> written;
            slice->async_write(Chunk(5, 1), io.get_executor(), [&written](std::error_code ec)
                               { written = ec; });
            run_until(io, [&]
                      { return written.has_value(); });
            assert(!*written);
            assert(!slice->close_writer(false));

            std::optional<std::error_code> read_result;
            slice->async_read(io.get_executor(), [&read_result](std::error_code ec, Chunk)
                              { read_result = ec; });
            run_until(io, [&]
                      { return read_result.has_value(); });
            assert(*read_result == ErrorCode::Aborted);
            assert(slice->occupied() == 0);
        }

        {
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            slice->set_expected_size(4);
            assert(!slice->attach_writer());
            std::optional<std::error_code> written;
            slice->async_write(Chunk(5, 1), io.get_executor(), [&written](std::error_code ec)
                               { written = ec; });
            run_until(io, [&]
                      { return written.has_value(); });
            assert(*written == ErrorCode::Aborted);
            assert(slice->aborted());
            assert(slice->attach_reader() == ErrorCode::Aborted);
        }

        {
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            assert(!slice->attach_writer());
            assert(!slice->attach_reader());
            int completed = 0;
            for (int i = 0; i < 3; ++i)
            {
                slice->async_write(Chunk(1000, 1), io.get_executor(), [&completed](std::error_code ec)
                                   {
                    assert(!ec);
                    ++completed; });
                run_until(io, [&]
                          { return completed == i + 1; });
            }
            assert(pool.used() == 3000);
            slice->close_reader();
            assert(pool.used() == 0);

            std::optional<std::error_code> after_close;
            slice->async_write(Chunk(1, 1), io.get_executor(), [&after_close](std::error_code ec)
                               { after_close = ec; });
            run_until(io, [&]
                      { return after_close.has_value(); });
            assert(*after_close == ErrorCode::Aborted);
            assert(!slice->close_writer(true));
            assert(pool.active_writers() == 0);
        }

        {
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            assert(!slice->attach_writer());
            assert(!slice->attach_reader());
            bool written = false;
            slice->async_write(Chunk(2000, 1), io.get_executor(), [&written](std::error_code ec)
                               {
                assert(!ec);
                written = true; });
            run_until(io, [&]
                      { return written; });
            assert(slice->close_writer(false));
            assert(pool.used() == 2000);
            slice->close_reader();
            assert(pool.used() == 0);
        }

        {
            auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
            assert(!slice->attach_writer());
            bool written = false;
            slice->async_write(Chunk(500, 1), io.get_executor(), [&written](std::error_code ec)
                               {
                assert(!ec);
                written = true; });
            run_until(io, [&]
                      { return written; });
            assert(pool.used() == 500);
            slice.reset();
            assert(pool.used() == 0);
            assert(pool.active_writers() == 0);
        }
    }

    std::shared_ptr<TransferSession> make_session(CachePool &pool, bool reverse, std::uint64_t file_size = 0)
    {
        SessionIdentity identity{};
        identity.path = "42-amber-falcon-river";
        identity.upload_key = "7-quiet-maple-stone";
        if (reverse)
        {
            identity.download_lock = "3-bold-cedar-lake";
        }
        auto slice = std::make_shared<CacheSlice>(pool, SliceOptions{});
        return std::make_shared<TransferSession>(std::move(identity), "report.pdf", file_size, std::move(slice),
                                                 std::chrono::system_clock::now());
    }

    void test_session_state_machine()
    {
        boost::asio::io_context io;
        CachePool pool(64 * 1024);
        auto session = make_session(pool, false, 6);

        assert(session->begin_upload("wrong-key", std::nullopt) == ErrorCode::Unauthorized);
        assert(session->upload_state() == TransferState::NotStarted);
        assert(!session->begin_upload("7-quiet-maple-stone", std::nullopt));
        assert(session->upload_state() == TransferState::InProgress);
        assert(session->begin_upload("7-quiet-maple-stone", std::nullopt) == ErrorCode::AlreadyAttached);
        assert(!session->set_file_size(12));

        assert(!session->begin_download());
        assert(session->download_state() == TransferState::InProgress);
        assert(session->begin_download() == ErrorCode::Locked);

        bool written = false;
        session->slice()->async_write(Chunk{'a', 'b', 'c', 'd', 'e', 'f'}, io.get_executor(), [&written](std::error_code ec)
                                      {
            assert(!ec);
            written = true; });
        run_until(io, [&]
                  { return written; });
        assert(session->finish_upload(false) == TransferState::Done);
        assert(session->begin_upload("7-quiet-maple-stone", std::nullopt) == ErrorCode::AlreadyCompleted);

        Consumer consumer{session->slice(), io.get_executor()};
        consumer.next();
        run_until(io, [&]
                  { return consumer.done.load(); });
        assert(!consumer.error);
        assert(consumer.received.size() == 6);
        assert(session->finish_download(true) == TransferState::Done);
        assert(session->is_terminal());
        assert(session->begin_download() == ErrorCode::AlreadyCompleted);

        // Terminal states never move again.
        session->expire();
        assert(session->upload_state() == TransferState::Done);
        assert(session->download_state() == TransferState::Done);
        assert(session->finish_download(false) == TransferState::Done);
    }

    void test_reverse_lock()
    {
        CachePool pool(64 * 1024);
        auto session = make_session(pool, true);
        assert(session->is_reverse());

        assert(session->begin_upload("7-quiet-maple-stone", std::nullopt) == ErrorCode::Locked);
        assert(session->upload_state() == TransferState::NotStarted);
        assert(session->begin_upload("7-quiet-maple-stone", std::string_view("9-wrong-lock")) == ErrorCode::Locked);
        assert(session->upload_state() == TransferState::NotStarted);
        assert(!session->slice()->writer_attached());

        assert(!session->begin_upload("7-quiet-maple-stone", std::string_view("3-bold-cedar-lake")));
        assert(session->upload_state() == TransferState::InProgress);

        const auto visible = session->snapshot(false);
        assert(!visible.upload_key && !visible.download_lock);
        const auto full = session->snapshot(true);
        assert(full.download_lock == "3-bold-cedar-lake");
    }

    void test_session_expire_and_metadata()
    {
        boost::asio::io_context io;
        CachePool pool(64 * 1024);
        auto session = make_session(pool, false);

        assert(!session->set_file_name("other.pdf"));
        assert(session->snapshot(false).file_name == "report.pdf");
        assert(session->set_file_size(100));
        session->set_compression("gzip");
        assert(session->compression() == "gzip");
        session->set_compression("");
        assert(session->compression() == "none");

        assert(!session->begin_upload("7-quiet-maple-stone", std::nullopt));
        assert(!session->begin_download());
        Consumer consumer{session->slice(), io.get_executor()};
        consumer.next();
        io.restart();
        io.run_for(10ms);
        assert(!consumer.done);

        session->expire();
        run_until(io, [&]
                  { return consumer.done.load(); });
        assert(consumer.error == ErrorCode::Aborted);
        assert(session->upload_state() == TransferState::Failed);
        assert(session->download_state() == TransferState::Failed);
        assert(session->finish_upload(false) == TransferState::Failed);
        assert(session->begin_download() == ErrorCode::AlreadyCompleted);

        SessionIdentity identity{"1-a-b-c", "2-d-e-f", std::nullopt};
        TransferSession unnamed(std::move(identity), "", 0, std::make_shared<CacheSlice>(pool, SliceOptions{}),
                                std::chrono::system_clock::now());
        assert(unnamed.set_file_name("from-form.bin"));
        assert(!unnamed.set_file_name("again.bin"));
        assert(unnamed.snapshot(false).file_name == "from-form.bin");
    }

    RegistryOptions registry_options()
    {
        RegistryOptions options{};
        options.expiry = 10s;
        options.completed_retention = 60s;
        return options;
    }

    void test_registry_basics()
    {
        CachePool pool(64 * 1024);
        SessionRegistry registry(pool, test_tokens(), registry_options());
        const auto now = std::chrono::system_clock::now();

        auto session = registry.create({"report.pdf", 0, false}, now);
        assert(registry.size() == 1);
        assert(registry.find(session->path()) == session);
        assert(!registry.find("0-no-such-path"));
        assert(!registry.touch("0-no-such-path", now));

        const auto snapshot = session->snapshot(true);
        assert(snapshot.file_name == "report.pdf");
        assert(snapshot.upload == TransferState::NotStarted);
        assert(snapshot.download == TransferState::NotStarted);
        assert(snapshot.upload_key && !snapshot.upload_key->empty());
        assert(!snapshot.download_lock);

        auto reverse = registry.create({"video.mp4", 0, true}, now);
        assert(reverse->is_reverse());
        assert(reverse->path() != session->path());
        assert(reverse->snapshot(true).download_lock);

        std::set<std::string> paths;
        for (int i = 0; i < 200; ++i)
        {
            paths.insert(registry.create({"bulk.bin", 0, false}, now)->path());
        }
        assert(paths.size() == 200);

        assert(registry.remove(session->path()));
        assert(!registry.find(session->path()));
        assert(!registry.remove(session->path()));
        assert(session->upload_state() == TransferState::Failed);

        registry.shutdown();
        assert(registry.size() == 0);
        assert(reverse->download_state() == TransferState::Failed);
    }

    void test_registry_exhaustion()
    {
        CachePool pool(1024);
        auto options = registry_options();
        options.path_format = "fixed";
        options.max_generation_attempts = 4;
        SessionRegistry registry(pool, test_tokens(), options);
        registry.create({"a", 0, false}, std::chrono::system_clock::now());

        bool threw = false;
        try
        {
            registry.create({"b", 0, false}, std::chrono::system_clock::now());
        }
        catch (const RelayError &error)
        {
            threw = error.code() == ErrorCode::InternalError;
        }
        assert(threw);
        assert(registry.size() == 1);
    }

    void test_registry_reap()
    {
        boost::asio::io_context io;
        CachePool pool(64 * 1024);
        SessionRegistry registry(pool, test_tokens(), registry_options());
        const auto t0 = std::chrono::system_clock::now();

        auto idle = registry.create({"idle.bin", 0, false}, t0);
        assert(!idle->begin_upload(idle->snapshot(true).upload_key.value(), std::nullopt));
        bool written = false;
        idle->slice()->async_write(Chunk(4096, 1), io.get_executor(), [&written](std::error_code ec)
                                   {
            assert(!ec);
            written = true; });
        run_until(io, [&]
                  { return written; });
        assert(pool.used() == 4096);

        auto busy = registry.create({"busy.bin", 0, false}, t0);

        auto report = registry.reap(t0 + 5s);
        assert(report.expired == 0 && registry.size() == 2);

        assert(registry.touch(busy->path(), t0 + 8s));
        report = registry.reap(t0 + 15s);
        assert(report.expired == 1);
        assert(!registry.find(idle->path()));
        assert(registry.find(busy->path()));
        assert(idle->upload_state() == TransferState::Failed);
        assert(pool.used() == 0);

        report = registry.reap(t0 + 19s);
        assert(report.expired == 1);
        assert(registry.size() == 0);
    }

    void test_completed_retention()
    {
        boost::asio::io_context io;
        CachePool pool(64 * 1024);
        SessionRegistry registry(pool, test_tokens(), registry_options());
        const auto t0 = std::chrono::system_clock::now();

        auto session = registry.create({"done.bin", 0, false}, t0);
        assert(!session->begin_upload(session->snapshot(true).upload_key.value(), std::nullopt));
        assert(!session->begin_download());
        assert(session->finish_upload(false) == TransferState::Done);
        Consumer consumer{session->slice(), io.get_executor()};
        consumer.next();
        run_until(io, [&]
                  { return consumer.done.load(); });
        assert(session->finish_download(true) == TransferState::Done);

        // Still visible so a repeated download is told it already happened.
        auto report = registry.reap(t0 + 5s);
        assert(report.completed == 0);
        auto again = registry.find(session->path());
        assert(again && again->begin_download() == ErrorCode::AlreadyCompleted);

        auto options = registry_options();
        options.completed_retention = 2s;
        SessionRegistry short_registry(pool, test_tokens(), options);
        auto finished = short_registry.create({"gone.bin", 0, false}, t0);
        finished->expire();
        report = short_registry.reap(t0 + 3s);
        assert(report.completed == 1);
        assert(short_registry.size() == 0);
    }

    void test_reaper()
    {
        boost::asio::io_context io;
        CachePool pool(64 * 1024);
        SessionRegistry registry(pool, test_tokens(), registry_options());
        registry.create({"old.bin", 0, false}, std::chrono::system_clock::now() - 1h);
        registry.create({"new.bin", 0, false}, std::chrono::system_clock::now());

        LivenessReaper reaper(io.get_executor(), registry, 1s);
        const auto report = reaper.run_once(std::chrono::system_clock::now());
        assert(report.expired == 1);
        assert(registry.size() == 1);

        reaper.start();
        io.restart();
        io.run_for(20ms);
        reaper.stop();
        io.restart();
        io.run_for(20ms);
        assert(registry.size() == 1);
    }

    void test_streaming_scenario()
    {
        constexpr std::size_t kPayload = 10 * 1024 * 1024;
        constexpr std::size_t kBlock = 64 * 1024;
        boost::asio::io_context io;
        CachePool pool(16 * 1024 * 1024);
        SessionRegistry registry(pool, test_tokens(), registry_options());

        auto session = registry.create({"report.pdf", 0, false}, std::chrono::system_clock::now());
        const auto created = session->snapshot(false);
        assert(created.upload == TransferState::NotStarted);
        assert(created.download == TransferState::NotStarted);

        const auto payload = make_payload(kPayload, 2024);
        assert(!session->begin_upload(session->snapshot(true).upload_key.value(), std::nullopt));
        assert(session->upload_state() == TransferState::InProgress);

        Consumer consumer{session->slice(), io.get_executor()};
        bool download_started = false;
        Producer producer{session->slice(), io.get_executor(), &payload, kBlock};
        producer.on_finished = [&]
        {
            assert(session->finish_upload(false) == TransferState::Done);
        };
        producer.on_progress = [&](std::size_t writes)
        {
            if (writes == 10 && !download_started)
            {
                download_started = true;
                assert(!session->begin_download());
                consumer.next();
            }
        };
        producer.next();
        run_until(io, [&]
                  { return producer.done.load() && consumer.done.load(); }, 60s);

        assert(download_started);
        assert(!producer.error);
        assert(!consumer.error);
        assert(consumer.received == payload);
        assert(session->upload_state() == TransferState::Done);
        assert(session->finish_download(true) == TransferState::Done);
        assert(pool.used() == 0);
    }

    void test_reverse_expiry_scenario()
    {
        CachePool pool(64 * 1024);
        auto options = registry_options();
        options.expiry = 1s;
        SessionRegistry registry(pool, test_tokens(), options);
        const auto t0 = std::chrono::system_clock::now();

        auto session = registry.create({"video.mp4", 0, true}, t0);
        const auto path = session->path();
        assert(!session->begin_download());

        const auto report = registry.reap(t0 + 2s);
        assert(report.expired == 1);
        assert(session->upload_state() == TransferState::Failed);
        assert(session->download_state() == TransferState::Failed);
        assert(!registry.find(path));
    }

} // namespace

void run_server_component_tests()
{
    spdlog::set_level(spdlog::level::warn);
    test_token_generator();
    test_cache_round_trip();
    test_upload_before_download();
    test_attach_exclusivity();
    test_capacity_invariant();
    test_backpressure_and_capacity();
    test_fair_share();
    test_stall_timeouts();
    test_read_stall_waits_for_producer();
    test_abort_semantics();
    test_session_state_machine();
    test_reverse_lock();
    test_session_expire_and_metadata();
    test_registry_basics();
    test_registry_exhaustion();
    test_registry_reap();
    test_completed_retention();
    test_reaper();
    test_streaming_scenario();
    test_reverse_expiry_scenario();
}
