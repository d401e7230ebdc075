// End-to-end tests for DayDownloader against the scripted fake device.

#include "vod_fetch/orchestrator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include "fixtures/FakeSession.h"
#include "vod_fetch/chunk_planner.hpp"
#include "vod_fetch/system.hpp"

using namespace vod_fetch;
using vod_fetch::tests::fixtures::FakeDevice;
using vod_fetch::tests::fixtures::TempDir;
using std::chrono::milliseconds;
using std::chrono::minutes;

namespace {

const CivilDate kDay{2024, 6, 10};

class DayDownloaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    device_ = std::make_shared<FakeDevice>();
    // 00:00-00:25 -> five 5-minute chunks
    device_->segments = {Segment{"Rec/a.mp4", make_timestamp(kDay, 0, 0, 0),
                                 make_timestamp(kDay, 0, 25, 0)}};
  }

  RunOptions Options(int workers) const {
    RunOptions o;
    o.day = kDay;
    o.output_dir = (dir_.path() / "out").string();
    o.num_workers = workers;
    o.chunk_duration = minutes(5);
    o.retry.max_retries = 2;
    o.retry.time_unit = milliseconds(1);
    return o;
  }

  std::size_t FilesInOutput() const {
    std::size_t n = 0;
    for (const auto& e :
         std::filesystem::directory_iterator(dir_.path() / "out")) {
      if (e.is_regular_file()) ++n;
    }
    return n;
  }

  std::shared_ptr<FakeDevice> device_;
  TempDir dir_;
};

}  // namespace

TEST_F(DayDownloaderTest, TwoWorkersPutEveryTaskInExactlyOneBucket)
{
  // One chunk already on disk, one chunk the device never serves.
  ChunkPlanner planner(minutes(5), Options(2).output_dir);
  std::filesystem::create_directories(Options(2).output_dir);
  {
    std::ofstream f(planner.output_path_for(kDay, make_timestamp(kDay, 0, 5, 0)),
                    std::ios::binary);
    f << "earlier run";
  }
  device_->always_busy.insert(format_compact(make_timestamp(kDay, 0, 15, 0)));
  device_->fetch_delay = milliseconds(2);

  DayDownloader downloader(device_->factory(), Options(2));
  RunSummary summary = downloader.run();

  EXPECT_EQ(summary.status, RunStatus::Completed);
  const ProgressSnapshot& p = summary.progress;
  EXPECT_EQ(p.total, 5u);
  EXPECT_EQ(p.downloaded + p.exists + p.failed, p.total);
  EXPECT_EQ(p.downloaded, 3u);
  EXPECT_EQ(p.exists, 1u);
  EXPECT_EQ(p.failed, 1u);
  ASSERT_EQ(summary.failed.size(), 1u);
  EXPECT_EQ(summary.failed[0].label(), "00:15-00:20");
  EXPECT_FALSE(summary.all_succeeded());

  // scout + two workers, every session logged out
  EXPECT_EQ(device_->sessions_created.load(), 3);
  EXPECT_EQ(device_->release_calls.load(), 3);
}

TEST_F(DayDownloaderTest, NoChunkIsFetchedConcurrentlyOrByTwoWorkers)
{
  device_->fetch_delay = milliseconds(3);
  DayDownloader downloader(device_->factory(), Options(2));
  RunSummary summary = downloader.run();

  EXPECT_EQ(summary.progress.downloaded, 5u);
  EXPECT_EQ(device_->max_in_flight_per_chunk.load(), 1);
  EXPECT_EQ(device_->distinct_chunks_fetched(), 5u);
  for (int m = 0; m < 25; m += 5) {
    std::string key = format_compact(make_timestamp(kDay, 0, m, 0));
    EXPECT_EQ(device_->fetchers_of(key).size(), 1u) << key;
  }
  EXPECT_EQ(device_->fetch_calls.load(), 5);
}

TEST_F(DayDownloaderTest, SecondRunFetchesNothing)
{
  {
    DayDownloader first(device_->factory(), Options(2));
    RunSummary s = first.run();
    ASSERT_EQ(s.progress.downloaded, 5u);
    ASSERT_TRUE(s.all_succeeded());
  }

  auto again = std::make_shared<FakeDevice>();
  again->segments = device_->segments;
  DayDownloader second(again->factory(), Options(2));
  RunSummary s = second.run();

  EXPECT_EQ(again->fetch_calls.load(), 0);
  EXPECT_EQ(s.progress.exists, 5u);
  EXPECT_EQ(s.progress.downloaded, 0u);
  EXPECT_TRUE(s.all_succeeded());
  EXPECT_EQ(FilesInOutput(), 5u);
}

TEST_F(DayDownloaderTest, NoRecordingsStartsNoWorkers)
{
  device_->segments.clear();
  DayDownloader downloader(device_->factory(), Options(2));

  RunSummary summary;
  ASSERT_NO_THROW(summary = downloader.run());

  EXPECT_EQ(summary.status, RunStatus::NoRecordings);
  EXPECT_EQ(summary.progress.total, 0u);
  EXPECT_EQ(device_->sessions_created.load(), 1);  // scout only
  EXPECT_EQ(device_->release_calls.load(), 1);
  EXPECT_EQ(device_->fetch_calls.load(), 0);
}

TEST_F(DayDownloaderTest, ListingFailureIsReportedNotThrown)
{
  device_->fail_listing = true;
  DayDownloader downloader(device_->factory(), Options(2));

  RunSummary summary = downloader.run();

  EXPECT_EQ(summary.status, RunStatus::ListingFailed);
  EXPECT_FALSE(summary.error.empty());
  EXPECT_EQ(device_->sessions_created.load(), 1);
  EXPECT_EQ(device_->release_calls.load(), 1);
}

TEST_F(DayDownloaderTest, ScoutLoginFailureIsListingFailure)
{
  device_->fail_login = true;
  DayDownloader downloader(device_->factory(), Options(1));

  RunSummary summary = downloader.run();

  EXPECT_EQ(summary.status, RunStatus::ListingFailed);
  EXPECT_EQ(device_->list_calls.load(), 0);
  EXPECT_EQ(device_->release_calls.load(), 1);
}

TEST_F(DayDownloaderTest, CancelledRunLeavesTasksNotAttempted)
{
  std::atomic<bool> cancel{true};
  DayDownloader downloader(device_->factory(), Options(2), &cancel);

  RunSummary summary = downloader.run();

  EXPECT_EQ(summary.status, RunStatus::Completed);
  EXPECT_EQ(device_->fetch_calls.load(), 0);
  EXPECT_EQ(summary.progress.not_attempted(), 5u);
  EXPECT_FALSE(summary.all_succeeded());
}

TEST(ScanRecordingDatesTest, ReturnsDaysWithRecordingsNewestFirst)
{
  auto device = std::make_shared<FakeDevice>();
  CivilDate today{2024, 3, 2};
  for (CivilDate d : {CivilDate{2024, 2, 28}, CivilDate{2024, 3, 2},
                      CivilDate{2024, 1, 1}}) {
    device->segments.push_back(Segment{"x", make_timestamp(d, 0, 10, 0),
                                       make_timestamp(d, 0, 40, 0)});
  }
  // Only records in the afternoon: the first-hour probe does not see it.
  device->segments.push_back(
      Segment{"y", make_timestamp(CivilDate{2024, 3, 1}, 14, 0, 0),
              make_timestamp(CivilDate{2024, 3, 1}, 15, 0, 0)});

  auto session = device->factory()();
  auto dates = scan_recording_dates(*session, 0, StreamQuality::Main, today);

  ASSERT_EQ(dates.size(), 2u);
  EXPECT_EQ(dates[0], (CivilDate{2024, 3, 2}));
  EXPECT_EQ(dates[1], (CivilDate{2024, 2, 28}));
  EXPECT_EQ(device->list_calls.load(), 30);
}

TEST(ScanRecordingDatesTest, ProbeFailuresAreSkipped)
{
  auto device = std::make_shared<FakeDevice>();
  device->fail_listing = true;
  auto session = device->factory()();

  auto dates = scan_recording_dates(*session, 0, StreamQuality::Sub,
                                    CivilDate{2024, 3, 2}, 7);
  EXPECT_TRUE(dates.empty());
  EXPECT_EQ(device->list_calls.load(), 7);
}
