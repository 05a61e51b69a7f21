#include <benchmark/benchmark.h>
#include "ferry/transfer/transfer_scheduler.hpp"
#include "ferry/transfer/transfer_channel.hpp"
#include "ferry/transfer/chunk_plan.hpp"
#include "ferry/crypto/content_hasher.hpp"
#include "ferry/core/logger.hpp"
#include <map>
#include <memory>
#include <vector>

using namespace ferry::transfer;
using ferry::core::Result;

namespace {

class NullTransport : public TransportBackend {
public:
    Result start(const TransportStart& request, std::shared_ptr<TransferChannel> channel) override {
        channels[request.record.id] = std::move(channel);
        return Result::ok();
    }
    
    void stop(const std::string& transfer_id) override {
        channels.erase(transfer_id);
    }
    
    std::map<std::string, std::shared_ptr<TransferChannel>> channels;
};

TransferSpec bench_spec(std::uint64_t size, int index) {
    TransferSpec spec;
    spec.protocol = Protocol::SFTP;
    spec.source_path = "/remote/file_" + std::to_string(index) + ".bin";
    spec.destination_path = "/tmp/file_" + std::to_string(index) + ".bin";
    spec.total_size = size;
    spec.priority = index % 3;
    return spec;
}

} // namespace

class SchedulerBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        spdlog::set_level(spdlog::level::critical);
        
        transport_ = std::make_shared<NullTransport>();
        registry_.register_backend(Protocol::SFTP, transport_);
        settings_.verify_transfers = false;
        settings_.auto_retry = false;
        settings_.max_concurrent = 4;
        history_ = std::make_unique<HistoryLog>();
        scheduler_ = std::make_unique<TransferScheduler>(settings_, registry_, *history_);
    }
    
    void TearDown(const ::benchmark::State& state) override {
        scheduler_.reset();
        history_.reset();
        transport_.reset();
    }
    
protected:
    std::shared_ptr<NullTransport> transport_;
    TransportRegistry registry_;
    TransferSettings settings_;
    std::unique_ptr<HistoryLog> history_;
    std::unique_ptr<TransferScheduler> scheduler_;
};

BENCHMARK_F(SchedulerBenchmarkFixture, EnqueueAndDispatch)(benchmark::State& state) {
    int index = 0;
    for (auto _ : state) {
        TransferRecord record;
        benchmark::DoNotOptimize(scheduler_->enqueue(bench_spec(1024 * 1024, index++), record));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(SchedulerBenchmarkFixture, ProgressTicks)(benchmark::State& state) {
    const std::uint64_t total = 1ULL << 40;
    TransferRecord record;
    scheduler_->enqueue(bench_spec(total, 0), record);
    auto channel = transport_->channels.at(record.id);
    channel->ready();
    
    std::uint64_t bytes = 0;
    for (auto _ : state) {
        bytes += 4096;
        channel->progress(bytes);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK_F(SchedulerBenchmarkFixture, CompleteTransfers)(benchmark::State& state) {
    int index = 0;
    for (auto _ : state) {
        TransferRecord record;
        scheduler_->enqueue(bench_spec(64 * 1024, index++), record);
        auto channel = transport_->channels.at(record.id);
        channel->ready();
        channel->progress(64 * 1024);
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_HistoryStats(benchmark::State& state) {
    HistoryLog history;
    auto now = std::chrono::system_clock::now();
    
    for (int i = 0; i < state.range(0); ++i) {
        TransferRecord record;
        record.id = "transfer_" + std::to_string(i);
        record.direction = i % 2 ? Direction::UPLOAD : Direction::DOWNLOAD;
        record.status = i % 10 ? TransferStatus::COMPLETED : TransferStatus::FAILED;
        record.file_name = "file_" + std::to_string(i) + (i % 3 ? ".jpg" : ".pdf");
        record.destination_path = "/dest/" + std::to_string(i % 17) + "/" + record.file_name;
        record.total_size = 1024 * (i + 1);
        record.average_speed = 1000.0 + i;
        history.record(record, now - std::chrono::minutes(i));
    }
    
    for (auto _ : state) {
        benchmark::DoNotOptimize(history.stats(now));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_HistoryStats)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_ChunkPlanBuild(benchmark::State& state) {
    const std::uint64_t total = static_cast<std::uint64_t>(state.range(0)) * 1024 * 1024;
    for (auto _ : state) {
        auto plan = ChunkPlan::build(total, 1024 * 1024);
        plan.mark_completed_through(total / 2);
        benchmark::DoNotOptimize(plan.contiguous_completed_bytes());
    }
}
BENCHMARK(BM_ChunkPlanBuild)->Arg(64)->Arg(4096);

static void BM_ContentHash(benchmark::State& state) {
    std::vector<std::uint8_t> data(static_cast<std::size_t>(state.range(0)), 0x5a);
    for (auto _ : state) {
        benchmark::DoNotOptimize(ferry::crypto::ContentHasher::hash(data));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ContentHash)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

BENCHMARK_MAIN();
