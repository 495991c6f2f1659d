#include <prism/core/log.h>
#include <prism/core/row_bands.h>

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace prism;

namespace
{

class RowBandsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Log::setQuiet(true);
        Log::clear();
    }

    void TearDown() override
    {
        Log::setQuiet(false);
    }

    // Each row is written by exactly one band, so plain ints are race free
    static void expectEachRowOnce(const std::vector<int>& visits)
    {
        for (size_t y = 0; y < visits.size(); ++y)
            EXPECT_EQ(visits[y], 1) << "row " << y;
    }
};

} // namespace

TEST_F(RowBandsTest, CoversEveryRowOnce)
{
    std::vector<int> visits(37, 0);
    dispatchRowBands(37, 5, [&](uint32_t start, uint32_t end)
    {
        for (uint32_t y = start; y < end; ++y)
            ++visits[y];
    });
    expectEachRowOnce(visits);
}

TEST_F(RowBandsTest, ThreadCountIsCappedByRows)
{
    std::atomic<int> bands{ 0 };
    std::vector<int> visits(3, 0);
    dispatchRowBands(3, 64, [&](uint32_t start, uint32_t end)
    {
        ++bands;
        EXPECT_EQ(end - start, 1u);
        ++visits[start];
    });
    EXPECT_EQ(bands.load(), 3);
    expectEachRowOnce(visits);

    dispatchRowBands(0, 4, [&](uint32_t, uint32_t) { ++bands; });
    EXPECT_EQ(bands.load(), 3);
}

TEST_F(RowBandsTest, FailedThreadStartTracesRemainingRowsInline)
{
    std::vector<int> visits(20, 0);
    int started = 0;
    auto spawnTwo = [&](auto&& task)
    {
        if (started == 2)
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        ++started;
        return std::thread(std::forward<decltype(task)>(task));
    };

    dispatchRowBands(20, 4, [&](uint32_t start, uint32_t end)
    {
        for (uint32_t y = start; y < end; ++y)
            ++visits[y];
    }, spawnTwo);

    EXPECT_EQ(started, 2);
    expectEachRowOnce(visits);

    auto entries = Log::getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, Log::Level::Warn);
}

TEST_F(RowBandsTest, OtherSpawnErrorsJoinStartedThreadsAndPropagate)
{
    std::atomic<int> rowsDone{ 0 };
    int started = 0;
    auto spawnOne = [&](auto&& task)
    {
        if (started == 1)
            throw std::runtime_error("spawn failed");
        ++started;
        return std::thread(std::forward<decltype(task)>(task));
    };

    EXPECT_THROW(dispatchRowBands(8, 4, [&](uint32_t start, uint32_t end)
    {
        rowsDone += static_cast<int>(end - start);
    }, spawnOne), std::runtime_error);

    // The one started band finished before the error left the dispatcher
    EXPECT_EQ(rowsDone.load(), 2);
}
