// ============================================================================
// RECEIVER TESTS
// ============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <atomic>
#include <fstream>
#include <thread>
#include <unistd.h>
#include <nlohmann/json.hpp>

#include "writer/base_writer.hpp"
#include "writer/fanout.hpp"
#include "writer/file_writer.hpp"
#include "writer/writer_manager.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

namespace {

fs::path tempFile(const std::string& name)
{
    auto path = fs::temp_directory_path() / ("scrapelens_" + std::to_string(::getpid()) + "_" + name);
    fs::remove(path);
    return path;
}

std::vector<nlohmann::json> readLines(const fs::path& path)
{
    std::vector<nlohmann::json> out;
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line)) {
        if (!line.empty()) out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

ScrapeBatch makeBatch(const std::string& job, std::vector<std::string> lines)
{
    ScrapeBatch b;
    b.Job       = job;
    b.Labels    = {{"instance", "h:1"}, {"job", job}};
    b.Lines     = std::move(lines);
    b.Timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000000));
    return b;
}

class ThrowingReceiver : public IReceiver {
public:
    const std::string& name() const override { return name_; }
    void append(const ScrapeBatch&) override { throw std::runtime_error("disk full"); }

private:
    std::string name_ = "broken";
};

// 记录 flush 顺序的 writer，flush_impl 故意放慢以放大交错窗口
class SequenceWriter : public base_writer {
public:
    explicit SequenceWriter(std::size_t capacity)
        : base_writer("sequence", capacity, std::chrono::milliseconds(1)) {}
    ~SequenceWriter() override { shutdown(); }

    std::vector<int> flushed() const
    {
        std::lock_guard lg(m_);
        return flushed_;
    }

protected:
    void flush_impl(const std::vector<ScrapeBatch>& batch) override
    {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        std::lock_guard lg(m_);
        for (const auto& b : batch) flushed_.push_back(std::stoi(b.Job));
    }

private:
    mutable std::mutex m_;
    std::vector<int>   flushed_;
};

} // namespace

// ============================================================================
// Fanout
// ============================================================================

TEST(Fanout, DeliversToEveryReceiver) {
    auto a = std::make_shared<RecordingReceiver>("a");
    auto b = std::make_shared<RecordingReceiver>("b");
    Fanout fanout({a, b});

    fanout.append(makeBatch("node", {"up 1"}));
    EXPECT_EQ(a->batches().size(), 1u);
    EXPECT_EQ(b->batches().size(), 1u);
}

TEST(Fanout, ReplacingReceiversRedirectsLaterBatches) {
    auto a = std::make_shared<RecordingReceiver>("a");
    auto b = std::make_shared<RecordingReceiver>("b");
    Fanout fanout({a});

    fanout.append(makeBatch("node", {"up 1"}));
    fanout.setReceivers({b});
    fanout.append(makeBatch("node", {"up 0"}));

    ASSERT_EQ(a->batches().size(), 1u);
    ASSERT_EQ(b->batches().size(), 1u);
    EXPECT_EQ(b->batches()[0].Lines.front(), "up 0");
    EXPECT_EQ(fanout.receivers().size(), 1u);
}

TEST(Fanout, FailingReceiverDoesNotBlockOthers) {
    auto good = std::make_shared<RecordingReceiver>("good");
    Fanout fanout({std::make_shared<ThrowingReceiver>(), nullptr, good});

    EXPECT_NO_THROW(fanout.append(makeBatch("node", {"up 1"})));
    EXPECT_EQ(good->batches().size(), 1u);
}

// ============================================================================
// FileWriter
// ============================================================================

TEST(FileWriter, WritesOneJsonObjectPerSample) {
    auto path = tempFile("samples.jsonl");
    {
        FileWriter writer("local", path.string(), 16);
        writer.append(makeBatch("node", {"foo 1", "up 1"}));
        writer.append(makeBatch("db", {"up 0"}));
    }

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["job"], "node");
    EXPECT_EQ(lines[0]["sample"], "foo 1");
    EXPECT_EQ(lines[0]["labels"]["instance"], "h:1");
    EXPECT_EQ(lines[0]["timestamp_ms"], 1700000000000LL);
    EXPECT_EQ(lines[2]["job"], "db");
    fs::remove(path);
}

TEST(FileWriter, FullBufferFlushesInBackground) {
    auto path = tempFile("full.jsonl");
    FileWriter writer("local", path.string(), 2);
    writer.append(makeBatch("node", {"a 1"}));
    writer.append(makeBatch("node", {"b 1"}));

    EXPECT_TRUE(waitFor([&] { return readLines(path).size() == 2; }));
    writer.shutdown();
    writer.append(makeBatch("node", {"dropped 1"}));
    EXPECT_EQ(readLines(path).size(), 2u);
    fs::remove(path);
}

TEST(BaseWriter, ExplicitFlushKeepsAppendOrder) {
    constexpr int kBatches = 2000;
    SequenceWriter writer(1);

    std::atomic<bool> done{false};
    std::thread flusher([&] {
        while (!done) writer.flush();
    });
    for (int i = 0; i < kBatches; ++i) {
        writer.append(makeBatch(std::to_string(i), {"up 1"}));
    }
    done = true;
    flusher.join();
    writer.shutdown();

    auto seq = writer.flushed();
    ASSERT_EQ(seq.size(), static_cast<size_t>(kBatches));
    for (int i = 0; i < kBatches; ++i) {
        ASSERT_EQ(seq[i], i) << "batch " << seq[i] << " flushed out of order at " << i;
    }
}

TEST(FileWriter, UnwritablePathThrows) {
    EXPECT_THROW({ FileWriter w("bad", "/nonexistent-dir/x/samples.jsonl", 4); }, std::runtime_error);
}

// ============================================================================
// writer_manager
// ============================================================================

TEST(WriterManager, BuildsNamedReceiversFromConfig) {
    auto path = tempFile("manager.jsonl");
    auto cfg = Config::fromString(
        "receivers_config:\n"
        "  receivers:\n"
        "    - name: local\n"
        "      type: FileReceiver\n"
        "      config: file_receiver_config\n"
        "file_receiver_config:\n"
        "  path: " + path.string() + "\n"
        "  buffer_size: 8\n");

    writer_manager manager(cfg);
    EXPECT_EQ(manager.list(), std::vector<std::string>{"local"});
    ASSERT_NE(manager.find("local"), nullptr);
    EXPECT_EQ(manager.find("missing"), nullptr);

    manager.find("local")->append(makeBatch("node", {"up 1"}));
    manager.shutdown();
    EXPECT_EQ(readLines(path).size(), 1u);
    fs::remove(path);
}

TEST(WriterManager, NoReceiversIsAllowed) {
    writer_manager manager(Config::fromString("lens_config:\n  log_level: info\n"));
    EXPECT_TRUE(manager.list().empty());
}

TEST(WriterManager, RejectsUnknownTypeAndDuplicates) {
    auto unknown = Config::fromString(
        "receivers_config:\n"
        "  receivers:\n"
        "    - {name: x, type: KafkaReceiver, config: none}\n");
    EXPECT_THROW({ writer_manager m(unknown); }, std::runtime_error);

    auto path = tempFile("dup.jsonl");
    auto duplicate = Config::fromString(
        "receivers_config:\n"
        "  receivers:\n"
        "    - {name: x, type: FileReceiver, config: f}\n"
        "    - {name: x, type: FileReceiver, config: f}\n"
        "f:\n"
        "  path: " + path.string() + "\n");
    EXPECT_THROW({ writer_manager m(duplicate); }, std::runtime_error);
    fs::remove(path);
}
