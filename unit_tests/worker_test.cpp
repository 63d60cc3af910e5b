/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "distributed/worker.hpp"

#include "common/errors.hpp"
#include "test_utils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

using namespace dgen;
using dgen::testing_utils::TempDir;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockGenerator : public Generator {
public:
  MOCK_METHOD(GeneratedChunk, generate, (ChunkId, const GeneratorSpec &), (override));
};

class MockPartitioner : public Partitioner {
public:
  MOCK_METHOD(PartitionedChunk, partition, (const GeneratedChunk &, const PartitionerConfig &),
              (override));
};

class MockIngest : public IngestClient {
public:
  MOCK_METHOD(void, publish,
              (const std::vector<std::filesystem::path> &, const IngestSettings &), (override));
};

std::string read_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

} // namespace

class WorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.work_dir = dir_.path() / "work";
    generator_ = std::make_shared<::testing::NiceMock<MockGenerator>>();
    partitioner_ = std::make_shared<::testing::NiceMock<MockPartitioner>>();
    ingest_ = std::make_shared<::testing::NiceMock<MockIngest>>();
  }

  Worker make_worker() { return Worker(config_, generator_, partitioner_, ingest_); }

  static GeneratedChunk generated(ChunkId id) {
    GeneratedChunk chunk;
    chunk.id = id;
    chunk.files = {"chunk" + std::to_string(id) + "_Object.csv"};
    return chunk;
  }

  static PartitionedChunk partitioned(ChunkId id) {
    PartitionedChunk chunk;
    chunk.id = id;
    chunk.files = {"chunk_" + std::to_string(id) + ".txt"};
    return chunk;
  }

  TempDir dir_;
  WorkerConfig config_;
  std::shared_ptr<::testing::NiceMock<MockGenerator>> generator_;
  std::shared_ptr<::testing::NiceMock<MockPartitioner>> partitioner_;
  std::shared_ptr<::testing::NiceMock<MockIngest>> ingest_;
};

TEST_F(WorkerTest, RequiresAllCollaborators) {
  EXPECT_THROW(Worker(config_, nullptr, partitioner_, ingest_), std::invalid_argument);
}

TEST_F(WorkerTest, ConfigureMaterializesShippedFiles) {
  RunConfiguration run;
  run.client_name = "client2";
  run.generator_spec_name = "example_spec.py";
  run.generator_spec = "spec = {}\n";
  run.partitioner_configs = {{"Object.cfg", "obj"}, {"../escape.cfg", "src"}};
  run.pregenerated_files = {{"visit_table.csv", "1,2\n"}};

  Worker worker = make_worker();
  worker.configure(run);

  EXPECT_EQ(worker.name(), "client2");
  EXPECT_EQ(read_file(config_.work_dir / "example_spec.py"), "spec = {}\n");
  EXPECT_EQ(read_file(config_.work_dir / "partitioner_cfg" / "Object.cfg"), "obj");
  EXPECT_EQ(read_file(config_.work_dir / "partitioner_cfg" / "escape.cfg"), "src");
  EXPECT_FALSE(std::filesystem::exists(config_.work_dir / "escape.cfg"));
  EXPECT_EQ(read_file(config_.work_dir / "visit_table.csv"), "1,2\n");
}

TEST_F(WorkerTest, ConfigurePassesSettingsToCollaborators) {
  RunConfiguration run;
  run.generator_arguments = "--visits 4";
  run.generator_spec_name = "s.py";
  run.partitioner_configs = {{"Source.cfg", ""}};
  run.ingest.db_name = "synth_db";

  Worker worker = make_worker();
  worker.configure(run);

  EXPECT_CALL(*generator_, generate(5, _)).WillOnce(Invoke([&](ChunkId id, const GeneratorSpec &spec) {
    EXPECT_EQ(spec.arguments, "--visits 4");
    EXPECT_EQ(spec.spec_file, config_.work_dir / "s.py");
    EXPECT_EQ(spec.work_dir, config_.work_dir);
    return generated(id);
  }));
  EXPECT_CALL(*partitioner_, partition(_, _))
      .WillOnce(Invoke([&](const GeneratedChunk &chunk, const PartitionerConfig &cfg) {
        EXPECT_EQ(cfg.cfg_files,
                  (std::vector<std::filesystem::path>{config_.work_dir / "partitioner_cfg" /
                                                      "Source.cfg"}));
        return partitioned(chunk.id);
      }));
  EXPECT_CALL(*ingest_, publish(_, _))
      .WillOnce(Invoke([](const std::vector<std::filesystem::path> &files,
                          const IngestSettings &settings) {
        EXPECT_EQ(files, (std::vector<std::filesystem::path>{"chunk_5.txt"}));
        EXPECT_EQ(settings.db_name, "synth_db");
      }));

  ChunkReport report = worker.process_chunk(5);
  EXPECT_EQ(report.id, 5);
  EXPECT_EQ(report.outcome, ChunkOutcome::SUCCEEDED);
  EXPECT_TRUE(report.message.empty());
}

TEST_F(WorkerTest, GeneratorFailureIsReported) {
  EXPECT_CALL(*generator_, generate(3, _)).WillOnce(Throw(GenerationError("exit code 1")));
  EXPECT_CALL(*partitioner_, partition(_, _)).Times(0);
  EXPECT_CALL(*ingest_, publish(_, _)).Times(0);

  Worker worker = make_worker();
  ChunkReport report = worker.process_chunk(3);
  EXPECT_EQ(report.outcome, ChunkOutcome::FAILED);
  EXPECT_THAT(report.message, HasSubstr("exit code 1"));
}

TEST_F(WorkerTest, IngestFailureIsReported) {
  ON_CALL(*generator_, generate(_, _)).WillByDefault(Invoke([](ChunkId id, const GeneratorSpec &) {
    return generated(id);
  }));
  ON_CALL(*partitioner_, partition(_, _))
      .WillByDefault(Invoke([](const GeneratedChunk &chunk, const PartitionerConfig &) {
        return partitioned(chunk.id);
      }));
  EXPECT_CALL(*ingest_, publish(_, _)).WillOnce(Throw(IngestError("czar unreachable")));

  Worker worker = make_worker();
  ChunkReport report = worker.process_chunk(8);
  EXPECT_EQ(report.outcome, ChunkOutcome::FAILED);
  EXPECT_THAT(report.message, HasSubstr("czar unreachable"));
}

TEST_F(WorkerTest, ReportCarriesStageTimings) {
  EXPECT_CALL(*generator_, generate(2, _))
      .WillOnce(Invoke([](ChunkId id, const GeneratorSpec &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        return generated(id);
      }));
  EXPECT_CALL(*partitioner_, partition(_, _))
      .WillOnce(Invoke([](const GeneratedChunk &chunk, const PartitionerConfig &) {
        return partitioned(chunk.id);
      }));
  EXPECT_CALL(*ingest_, publish(_, _)).Times(1);

  Worker worker = make_worker();
  ChunkReport report = worker.process_chunk(2);
  EXPECT_EQ(report.outcome, ChunkOutcome::SUCCEEDED);
  EXPECT_GE(report.timing.generate_us, 25000u);
  EXPECT_LT(report.timing.partition_us, report.timing.generate_us);
}

TEST_F(WorkerTest, UnexpectedExceptionsBecomeFailures) {
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(Throw(std::runtime_error("disk full")));

  Worker worker = make_worker();
  ChunkReport report = worker.process_chunk(1);
  EXPECT_EQ(report.outcome, ChunkOutcome::FAILED);
  EXPECT_THAT(report.message, HasSubstr("disk full"));
}

TEST_F(WorkerTest, SkipIngestStillSucceeds) {
  RunConfiguration run;
  run.ingest.skip = true;
  Worker worker = make_worker();
  worker.configure(run);

  ON_CALL(*generator_, generate(_, _)).WillByDefault(Invoke([](ChunkId id, const GeneratorSpec &) {
    return generated(id);
  }));
  ON_CALL(*partitioner_, partition(_, _))
      .WillByDefault(Invoke([](const GeneratedChunk &chunk, const PartitionerConfig &) {
        return partitioned(chunk.id);
      }));
  EXPECT_CALL(*ingest_, publish(_, _)).Times(0);

  EXPECT_EQ(worker.process_chunk(2).outcome, ChunkOutcome::SUCCEEDED);
}

TEST_F(WorkerTest, ChunkDirectoryIsRemovedUnlessKept) {
  std::filesystem::path chunk_dir = dir_.path() / "chunk9";
  ON_CALL(*generator_, generate(_, _))
      .WillByDefault(Invoke([&](ChunkId id, const GeneratorSpec &) {
        std::filesystem::create_directories(chunk_dir);
        GeneratedChunk chunk = generated(id);
        chunk.directory = chunk_dir;
        return chunk;
      }));
  ON_CALL(*partitioner_, partition(_, _))
      .WillByDefault(Invoke([](const GeneratedChunk &chunk, const PartitionerConfig &) {
        return partitioned(chunk.id);
      }));

  Worker worker = make_worker();
  RunConfiguration run;
  run.keep_csv = true;
  worker.configure(run);
  EXPECT_EQ(worker.process_chunk(9).outcome, ChunkOutcome::SUCCEEDED);
  EXPECT_TRUE(std::filesystem::exists(chunk_dir));

  run.keep_csv = false;
  worker.configure(run);
  EXPECT_EQ(worker.process_chunk(9).outcome, ChunkOutcome::SUCCEEDED);
  EXPECT_FALSE(std::filesystem::exists(chunk_dir));
}

TEST_F(WorkerTest, RunFailsWithoutCoordinator) {
  config_.server_port = 1;
  config_.retry = false;
  Worker worker = make_worker();
  EXPECT_THROW(worker.run(), std::system_error);
}
