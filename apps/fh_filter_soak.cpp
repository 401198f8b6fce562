// SPDX-License-Identifier: Apache-2.0
// Part of FilterHub (FH) project.
// apps/fh_filter_soak.cpp

#include "fh/buffered_filter.hpp"
#include "fh/filter_id.hpp"
#include "fh/log.hpp"
#include "fh/mem_filter_store.hpp"
#include "fh/reaper.hpp"
#include "fh/store_config.hpp"
#include "fh/sub_channel.hpp"
#include "soak_options.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

namespace {

using fh::soak::SoakConfig;

struct Stats {
    std::atomic<std::uint64_t> installed{0};
    std::atomic<std::uint64_t> rejected_full{0};
    std::atomic<std::uint64_t> id_failures{0};
    std::atomic<std::uint64_t> uninstalled{0};
    std::atomic<std::uint64_t> vanished{0};   // evicted under a live poller
    std::atomic<std::uint64_t> results_taken{0};
    std::atomic<std::uint64_t> results_streamed{0};
};

// Silences all console output by redirecting stdout/stderr to /dev/null.
void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

struct Owned {
    std::shared_ptr<fh::BufferedFilter> filter;
    std::shared_ptr<fh::SubChannel>     ch;
    bool abandoned = false;
};

void worker(int idx, const SoakConfig& cfg, fh::MemFilterStore& store,
            Stats& st, std::chrono::steady_clock::time_point deadline)
{
    std::mt19937 rng(static_cast<std::uint32_t>(std::random_device{}() + idx));
    std::uniform_int_distribution<int> pct(0, 99);
    std::vector<Owned> mine;
    fh::Context ctx;

    while (std::chrono::steady_clock::now() < deadline) {
        // install
        fh::FilterID id;
        if (fh::new_filter_id(id) != fh::Errc::Ok) {
            st.id_failures.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        auto f = std::make_shared<fh::BufferedFilter>(id, cfg.max_results);
        const fh::Errc rc = store.add(ctx, f);
        if (rc == fh::Errc::Ok) {
            st.installed.fetch_add(1, std::memory_order_relaxed);
            Owned o;
            o.filter = f;
            o.abandoned = pct(rng) < cfg.abandon_pct;
            if (!o.abandoned && pct(rng) < cfg.subscribe_pct) {
                o.ch = std::make_shared<fh::SubChannel>();
                f->set_sub_channel(o.ch);
            }
            mine.push_back(std::move(o));
        } else if (rc == fh::Errc::MaxFilters) {
            st.rejected_full.fetch_add(1, std::memory_order_relaxed);
        } else {
            fh::log_line("SOAK", std::string("add failed: ") + fh::to_string(rc));
        }

        // feed + poll
        for (auto it = mine.begin(); it != mine.end();) {
            it->filter->collect(it->filter->id().hex());

            fh::FilterPtr got;
            if (store.get(ctx, it->filter->id(), got) == fh::Errc::NotFound) {
                if (!it->abandoned) st.vanished.fetch_add(1, std::memory_order_relaxed);
                it = mine.erase(it);
                continue;
            }
            if (it->abandoned) { ++it; continue; }

            if (it->ch) {
                st.results_streamed.fetch_add(it->ch->drain().size(), std::memory_order_relaxed);
            }
            auto bf = std::dynamic_pointer_cast<fh::BufferedFilter>(got);
            if (bf) {
                st.results_taken.fetch_add(bf->take_collected().size(), std::memory_order_relaxed);
            }

            // occasional explicit uninstall
            if (pct(rng) < 2) {
                if (store.remove(ctx, it->filter->id()) == fh::Errc::Ok) {
                    st.uninstalled.fetch_add(1, std::memory_order_relaxed);
                }
                it->filter->clear_sub_channel();
                if (it->ch) it->ch->close();
                it = mine.erase(it);
                continue;
            }
            ++it;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void log_stats(const char* tag, const Stats& st, const fh::MemFilterStore& store,
               const fh::FilterReaper& reaper)
{
    fh::log_line("SOAK", std::string(tag) +
                 " size=" + std::to_string(store.size()) + "/" + std::to_string(store.max_filters()) +
                 " installed=" + std::to_string(st.installed.load()) +
                 " full=" + std::to_string(st.rejected_full.load()) +
                 " uninstalled=" + std::to_string(st.uninstalled.load()) +
                 " evicted=" + std::to_string(reaper.total_evicted()) +
                 " vanished=" + std::to_string(st.vanished.load()) +
                 " taken=" + std::to_string(st.results_taken.load()) +
                 " streamed=" + std::to_string(st.results_streamed.load()) +
                 " id_fail=" + std::to_string(st.id_failures.load()));
}

} // namespace

int main(int argc, char** argv) {
    SoakConfig cfg;
    if (!fh::soak::parse_soak_args(argc, argv, cfg)) {
        fh::soak::print_usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (cfg.quiet) {
        make_process_quiet();
    }
    fh::set_log_file(cfg.log_file);

    try {
        fh::MemFilterStore store(cfg.store);
        fh::FilterReaper reaper(store, cfg.reaper);

        fh::log_line("SOAK", "starting: workers=" + std::to_string(cfg.workers) +
                     " run=" + std::to_string(cfg.run_sec) + "s" +
                     " max_filters=" + std::to_string(cfg.store.max_filters) +
                     " max_results=" + std::to_string(cfg.max_results));
        reaper.start();

        Stats st;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(cfg.run_sec);
        std::vector<std::thread> threads;
        threads.reserve(cfg.workers);
        for (int i = 0; i < cfg.workers; ++i) {
            threads.emplace_back(worker, i, std::cref(cfg), std::ref(store), std::ref(st), deadline);
        }

        while (std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            log_stats("progress", st, store, reaper);
        }
        for (auto& t : threads) t.join();

        reaper.stop();
        log_stats("done", st, store, reaper);
    } catch (const std::exception& e) {
        fh::log_line("FATAL", std::string("exception: ") + e.what());
        return 1;
    }
    return 0;
}
