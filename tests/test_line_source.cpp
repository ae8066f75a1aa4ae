#include <gtest/gtest.h>

#include "itemstream/checkpoint_store.hpp"
#include "itemstream/checkpointed_reader.hpp"
#include "itemstream/errors.hpp"
#include "itemstream/gzip_reader.hpp"
#include "itemstream/line_source.hpp"
#include "testing.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <zlib.h>

namespace {

using itemstream::LineSource;

void WriteGzip(const std::string& path, const std::vector<std::string>& members) {
    // Each string becomes its own gzip member.
    for (size_t i = 0; i < members.size(); ++i) {
        gzFile gz = gzopen(path.c_str(), i == 0 ? "wb" : "ab");
        ASSERT_NE(gz, nullptr);
        ASSERT_EQ(gzwrite(gz, members[i].data(), static_cast<unsigned>(members[i].size())),
                  static_cast<int>(members[i].size()));
        ASSERT_EQ(gzclose(gz), Z_OK);
    }
}

std::vector<std::string> Drain(LineSource& src) {
    std::vector<std::string> out;
    while (auto line = src.Next()) out.push_back(*line);
    return out;
}

TEST(LineSourceTest, SplitsLines) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("in.txt");
    testutil::WriteFile(path, "alpha\nbeta\r\n\ngamma");

    LineSource src(path);
    src.Open();
    EXPECT_EQ(Drain(src), (std::vector<std::string>{"alpha", "beta", "", "gamma"}));
    EXPECT_EQ(src.LineNumber(), 4u);
    EXPECT_FALSE(src.Next().has_value());
    src.Close();
}

TEST(LineSourceTest, EmptyFileHasNoItems) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("empty.txt");
    testutil::WriteFile(path, "");

    LineSource src(path);
    src.Open();
    EXPECT_FALSE(src.Next().has_value());
}

TEST(LineSourceTest, LinesSpanningReadBuffers) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("long.txt");
    const std::string a(100 * 1024, 'a');
    const std::string b(70 * 1024, 'b');
    testutil::WriteFile(path, a + "\n" + b + "\n");

    LineSource src(path);
    src.Open();
    EXPECT_EQ(src.Next(), a);
    EXPECT_EQ(src.Next(), b);
    EXPECT_FALSE(src.Next().has_value());
}

TEST(LineSourceTest, OverlongLineIsFormatError) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("in.txt");
    testutil::WriteFile(path, "ok\n" + std::string(64, 'x') + "\n");

    itemstream::LineSourceOptions opt;
    opt.max_line_bytes = 16;
    LineSource src(path, opt);
    src.Open();
    EXPECT_EQ(src.Next(), "ok");
    EXPECT_THROW(src.Next(), itemstream::FormatError);
}

TEST(LineSourceTest, OverlongLineIsSkippedWithinOneBuffer) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("in.txt");
    testutil::WriteFile(path, "ok\n" + std::string(64, 'x') + "\nafter\n");

    itemstream::LineSourceOptions opt;
    opt.max_line_bytes = 16;
    LineSource src(path, opt);
    src.Open();
    EXPECT_EQ(src.Next(), "ok");
    EXPECT_THROW(src.Next(), itemstream::FormatError);
    EXPECT_EQ(src.Next(), "after");
    EXPECT_FALSE(src.Next().has_value());
    EXPECT_EQ(src.LineNumber(), 3u);
}

TEST(LineSourceTest, OverlongLineIsSkippedAcrossBuffers) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("in.txt");
    testutil::WriteFile(path, "ok\n" + std::string(100000, 'x') + "\nafter\n");

    itemstream::LineSourceOptions opt;
    opt.max_line_bytes = 70000;
    LineSource src(path, opt);
    src.Open();
    EXPECT_EQ(src.Next(), "ok");
    EXPECT_THROW(src.Next(), itemstream::FormatError);
    EXPECT_EQ(src.Next(), "after");
    EXPECT_FALSE(src.Next().has_value());
}

TEST(LineSourceTest, OverlongLastLineEndsInput) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("in.txt");
    testutil::WriteFile(path, "ok\n" + std::string(64, 'x'));

    itemstream::LineSourceOptions opt;
    opt.max_line_bytes = 16;
    LineSource src(path, opt);
    src.Open();
    EXPECT_EQ(src.Next(), "ok");
    EXPECT_THROW(src.Next(), itemstream::FormatError);
    EXPECT_FALSE(src.Next().has_value());
}

TEST(LineSourceTest, ReaderSkipsOverlongLineAndResumesAfterIt) {
    testutil::TemporaryDirectory dir;
    const std::string input = dir.File("in.txt");
    testutil::WriteFile(input, "ok\n" + std::string(100000, 'x') + "\nafter\nlast\n");

    itemstream::LineSourceOptions src_opt;
    src_opt.max_line_bytes = 70000;
    itemstream::ReaderOptions opt;
    opt.stream_name = "lines";

    itemstream::CheckpointContext ctx;
    {
        itemstream::CheckpointedReader<std::string> reader(
            std::make_unique<LineSource>(input, src_opt), opt);
        reader.Open(ctx);
        EXPECT_EQ(reader.Read(), "ok");
        EXPECT_THROW(reader.Read(), itemstream::FormatError);
        EXPECT_EQ(reader.ItemsRead(), 2u);
        reader.Checkpoint(ctx);

        EXPECT_EQ(reader.Read(), "after");
        EXPECT_EQ(reader.ItemsRead(), 3u);
        reader.Close(ctx);
    }

    itemstream::CheckpointedReader<std::string> reader(
        std::make_unique<LineSource>(input, src_opt), opt);
    reader.Open(ctx);
    EXPECT_EQ(reader.ItemsRead(), 2u);
    EXPECT_EQ(reader.Read(), "after");
    EXPECT_EQ(reader.Read(), "last");
    EXPECT_FALSE(reader.Read().has_value());
}

TEST(LineSourceTest, AdvanceLandsWhereNextWould) {
    testutil::TemporaryDirectory dir;
    const std::string input = dir.File("in.txt");
    testutil::WriteFile(input, "a\r\n\nc\n" + std::string(200000, 'd') + "\ne\nf");

    LineSource skipped(input);
    skipped.Open();
    skipped.Advance(4);
    EXPECT_EQ(skipped.Next(), "e");

    LineSource read(input);
    read.Open();
    for (int i = 0; i < 4; ++i) read.Next();
    EXPECT_EQ(read.Next(), "e");
}

TEST(LineSourceTest, AdvanceCountsUnterminatedLastLine) {
    testutil::TemporaryDirectory dir;
    const std::string input = dir.File("in.txt");
    testutil::WriteFile(input, "a\nb");

    LineSource src(input);
    src.Open();
    src.Advance(2);
    EXPECT_FALSE(src.Next().has_value());
}

TEST(LineSourceTest, AdvancePastEndIsAdvanceError) {
    testutil::TemporaryDirectory dir;
    const std::string input = dir.File("in.txt");
    testutil::WriteFile(input, "a\nb\n");

    LineSource src(input);
    src.Open();
    EXPECT_THROW(src.Advance(3), itemstream::AdvanceError);
}

TEST(LineSourceTest, AdvanceSkipsOverlongLine) {
    testutil::TemporaryDirectory dir;
    const std::string input = dir.File("in.txt");
    testutil::WriteFile(input, std::string(5000, 'x') + "\nnext\n");

    itemstream::LineSourceOptions opt;
    opt.max_line_bytes = 100;
    LineSource src(input, opt);
    src.Open();
    src.Advance(1);
    EXPECT_EQ(src.Next(), "next");
}

TEST(LineSourceTest, MissingFileIsOpenError) {
    testutil::TemporaryDirectory dir;
    LineSource src(dir.File("nope.txt"));
    EXPECT_THROW(src.Open(), itemstream::OpenError);
    EXPECT_NO_THROW(src.Close());
}

TEST(LineSourceTest, NextBeforeOpenIsSourceError) {
    LineSource src("/does/not/matter");
    EXPECT_THROW(src.Next(), itemstream::SourceError);
}

TEST(LineSourceTest, InflatesGzipBySuffix) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("in.txt.gz");
    WriteGzip(path, {"one\ntwo\n", "three\n"});

    LineSource src(path);
    src.Open();
    EXPECT_EQ(Drain(src), (std::vector<std::string>{"one", "two", "three"}));
}

TEST(LineSourceTest, ForcedGzipWithoutSuffix) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("in.data");
    WriteGzip(path, {"x\ny\n"});

    itemstream::LineSourceOptions opt;
    opt.compression = itemstream::Compression::Gzip;
    LineSource src(path, opt);
    src.Open();
    EXPECT_EQ(Drain(src), (std::vector<std::string>{"x", "y"}));
}

TEST(LineSourceTest, CorruptGzipIsFormatError) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.File("bad.gz");
    testutil::WriteFile(path, std::string("\x1f\x8b\x08\x00garbage-garbage-garbage", 27));

    LineSource src(path);
    src.Open();
    EXPECT_THROW(src.Next(), itemstream::FormatError);
}

TEST(LineSourceTest, TruncatedGzipIsFormatError) {
    testutil::TemporaryDirectory dir;
    const std::string full = dir.File("full.gz");
    WriteGzip(full, {std::string(4096, 'q') + "\n"});
    const std::string data = testutil::ReadFile(full);

    const std::string cut = dir.File("cut.gz");
    testutil::WriteFile(cut, data.substr(0, data.size() / 2));

    LineSource src(cut);
    src.Open();
    EXPECT_THROW(src.Next(), itemstream::FormatError);
}

TEST(LineSourceTest, ReaderResumesAcrossRunsThroughStateFile) {
    testutil::TemporaryDirectory dir;
    const std::string input = dir.File("orders.csv.gz");
    WriteGzip(input, {"o1\no2\no3\no4\no5\n"});
    const itemstream::CheckpointStore store(dir.File("state.json"));

    itemstream::ReaderOptions opt;
    opt.stream_name = "orders";

    // First run stops after three items.
    {
        itemstream::CheckpointContext ctx = store.Load();
        itemstream::CheckpointedReader<std::string> reader(std::make_unique<LineSource>(input), opt);
        reader.Open(ctx);
        EXPECT_EQ(reader.Read(), "o1");
        EXPECT_EQ(reader.Read(), "o2");
        EXPECT_EQ(reader.Read(), "o3");
        reader.Checkpoint(ctx);
        store.Save(ctx);
        reader.Close(ctx);
    }

    itemstream::CheckpointContext ctx = store.Load();
    EXPECT_EQ(ctx.GetLong("orders.read.count"), 3);

    itemstream::CheckpointedReader<std::string> reader(std::make_unique<LineSource>(input), opt);
    reader.Open(ctx);
    EXPECT_EQ(reader.Read(), "o4");
    EXPECT_EQ(reader.Read(), "o5");
    EXPECT_FALSE(reader.Read().has_value());
}

TEST(LineSourceTest, ShrunkInputFailsRestore) {
    testutil::TemporaryDirectory dir;
    const std::string input = dir.File("in.txt");
    testutil::WriteFile(input, "a\nb\nc\n");

    itemstream::CheckpointContext ctx;
    ctx.PutLong("lines.read.count", 5);

    itemstream::ReaderOptions opt;
    opt.stream_name = "lines";
    itemstream::CheckpointedReader<std::string> reader(std::make_unique<LineSource>(input), opt);
    EXPECT_THROW(reader.Open(ctx), itemstream::StreamRestoreError);
}

TEST(LineSourceTest, MissingInputIsInitError) {
    testutil::TemporaryDirectory dir;
    itemstream::ReaderOptions opt;
    opt.stream_name = "lines";
    itemstream::CheckpointedReader<std::string> reader(
        std::make_unique<LineSource>(dir.File("missing.txt")), opt);

    itemstream::CheckpointContext ctx;
    EXPECT_THROW(reader.Open(ctx), itemstream::StreamInitError);
}

} // namespace
