/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/impl/media_transport.hpp"

#include <gtest/gtest.h>

#include "testutil/mocks/transport/media_channel_mock.hpp"

namespace ferry::transport {
  using content::StreamHandle;
  using testing::_;
  using testing::Return;
  using testing::SaveArg;

  class MediaTransportTest : public ::testing::Test {
   public:
    void SetUp() override {
      auto content{std::make_shared<content::ContentRequest>()};
      content->content_id = content::ContentId{Bytes{0xaa}};
      content->kind = content::MediaKind::kVideo;
      content->size = 1000;
      content->streaming_consumer = true;
      request.session_id = 9;
      request.content = content;
      request.bitrate = initial;
      request.cancel = std::make_shared<CancelToken>();
      request.on_metric = [this](const QualityMetric &metric) {
        metrics.push_back(metric);
      };
      request.on_progress = [this](uint64_t bytes, uint64_t total) {
        progress.emplace_back(bytes, total);
      };
    }

    void attempt() {
      transport->attempt(request, [this](AttemptOutcome outcome) {
        outcomes.push_back(std::move(outcome));
      });
    }

    /// Opens the mocked channel and captures the stack callbacks
    void startChannel() {
      EXPECT_CALL(*connector, open(_))
          .WillOnce(Return(outcome::success(
              std::static_pointer_cast<MediaChannel>(channel))));
      EXPECT_CALL(*channel, start(_, initial, _))
          .WillOnce(SaveArg<2>(&callbacks));
      attempt();
    }

    BitrateDecision initial{1'000'000, quality::ResolutionTier::kMedium};
    std::shared_ptr<MediaConnectorMock> connector{
        std::make_shared<MediaConnectorMock>()};
    std::shared_ptr<MediaChannelMock> channel{
        std::make_shared<MediaChannelMock>()};
    std::shared_ptr<MediaTransport> transport{
        std::make_shared<MediaTransport>(connector)};
    AttemptRequest request;
    MediaChannel::Callbacks callbacks;
    std::vector<AttemptOutcome> outcomes;
    std::vector<QualityMetric> metrics;
    std::vector<std::pair<uint64_t, uint64_t>> progress;
  };

  /**
   * @given stream that reports stats and data, then ends
   * @when attempt runs
   * @then stats become metrics, data becomes progress, end delivers the
   * stream handle and releases the channel
   */
  TEST_F(MediaTransportTest, StreamDelivered) {
    startChannel();
    EXPECT_EQ(transport->activeChannels(), 1);

    callbacks.on_stats({40, 2.5, 900'000});
    callbacks.on_data(500);
    callbacks.on_end(StreamHandle{"stream-9"});

    ASSERT_EQ(metrics.size(), 1);
    EXPECT_EQ(metrics[0].session_id, 9);
    EXPECT_EQ(metrics[0].rtt, std::chrono::microseconds{40000});
    EXPECT_DOUBLE_EQ(metrics[0].loss_rate, 0.025);
    EXPECT_DOUBLE_EQ(metrics[0].throughput, 900'000);
    ASSERT_EQ(progress.size(), 1);
    EXPECT_EQ(progress[0], (std::pair<uint64_t, uint64_t>{500, 1000}));

    ASSERT_EQ(outcomes.size(), 1);
    auto &delivered{boost::get<Delivered>(outcomes[0])};
    EXPECT_EQ(boost::get<StreamHandle>(delivered.data).stream_id, "stream-9");
    EXPECT_EQ(delivered.bytes, 1000);
    EXPECT_EQ(transport->activeChannels(), 0);
  }

  /**
   * @given request carrying a lowered starting bitrate
   * @when attempt runs
   * @then channel starts at the bitrate of the request
   */
  TEST_F(MediaTransportTest, StartsAtRequestBitrate) {
    request.bitrate = BitrateDecision{500'000, quality::ResolutionTier::kLow};
    EXPECT_CALL(*connector, open(_))
        .WillOnce(Return(outcome::success(
            std::static_pointer_cast<MediaChannel>(channel))));
    EXPECT_CALL(*channel, start(_, *request.bitrate, _)).Times(1);
    attempt();
    EXPECT_TRUE(outcomes.empty());
  }

  /**
   * @given request without starting bitrate
   * @when attempt runs
   * @then no channel is opened and attempt reports transport error
   */
  TEST_F(MediaTransportTest, NoStartingBitrate) {
    request.bitrate = boost::none;
    EXPECT_CALL(*connector, open(_)).Times(0);
    attempt();
    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_NO_THROW(boost::get<Errored>(outcomes[0]));
  }

  /**
   * @given no media path
   * @when attempt runs
   * @then transport is unavailable
   */
  TEST_F(MediaTransportTest, NoMediaPath) {
    EXPECT_CALL(*connector, open(_))
        .WillOnce(Return(outcome::failure(
            std::make_error_code(std::errc::host_unreachable))));
    attempt();
    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_NO_THROW(boost::get<Unavailable>(outcomes[0]));
    EXPECT_EQ(transport->activeChannels(), 0);
  }

  /**
   * @given stream in progress
   * @when bitrate decisions arrive
   * @then they reach the channel of the session only
   */
  TEST_F(MediaTransportTest, ApplyBitrate) {
    startChannel();
    BitrateDecision lower{600'000, quality::ResolutionTier::kLow};
    EXPECT_CALL(*channel, setTargetBitrate(lower)).Times(1);
    transport->applyBitrate(9, lower);
    transport->applyBitrate(10, lower);
  }

  /**
   * @given stream in progress
   * @when attempt is cancelled
   * @then channel is stopped, attempt reports once, late end is ignored
   */
  TEST_F(MediaTransportTest, Cancel) {
    startChannel();
    EXPECT_CALL(*channel, stop()).Times(1);
    request.cancel->cancel();
    callbacks.on_stats({10, 0, 1});
    callbacks.on_end(StreamHandle{"late"});

    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_EQ(boost::get<Errored>(outcomes[0]).detail, "cancelled");
    EXPECT_TRUE(metrics.empty());
    EXPECT_EQ(transport->activeChannels(), 0);
  }

  /**
   * @given stream failing in the stack
   * @when it ends with error
   * @then attempt reports transport error
   */
  TEST_F(MediaTransportTest, StreamFailed) {
    startChannel();
    callbacks.on_end(outcome::failure(
        std::make_error_code(std::errc::connection_reset)));
    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_NO_THROW(boost::get<Errored>(outcomes[0]));
  }

}  // namespace ferry::transport
