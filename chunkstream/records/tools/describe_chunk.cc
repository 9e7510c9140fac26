// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Command line tool printing the address and records of chunk files.

#include <stddef.h>
#include <stdint.h>

#include <iostream>
#include <ostream>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/escaping.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "chunkstream/bytes/fd_reader.h"
#include "chunkstream/records/chunk_file_reader.h"
#include "chunkstream/records/chunk_record.h"
#include "chunkstream/records/chunk_record_reader.h"
#include "chunkstream/records/corrupt_record.h"

ABSL_FLAG(bool, includes_keys, false,
          "If true, each record is a key frame followed by a value frame.");
ABSL_FLAG(bool, show_records, false,
          "If true, show keys and values of records, not only their count.");
ABSL_FLAG(int64_t, max_records, -1,
          "If non-negative, stop after this many records of each file.");
ABSL_FLAG(bool, compressed, true,
          "If true, files are gzip-compressed. If false, files hold frames "
          "directly.");

namespace chunkstream::tools {
namespace {

// Returns `true` if all records up to `--max_records` were decoded.
bool DescribeRecords(ChunkRecordReaderBase& reader, std::ostream& report) {
  const ChunkAddress& address = reader.address();
  report << "  topic: \"" << absl::CHexEscape(address.topic) << "\"\n"
         << "  partition: " << address.partition << "\n"
         << "  start_offset: " << address.start_offset << "\n";
  const int64_t max_records = absl::GetFlag(FLAGS_max_records);
  const bool show_records = absl::GetFlag(FLAGS_show_records);
  uint64_t num_records = 0;
  ChunkRecord record;
  while (max_records < 0 || num_records < static_cast<uint64_t>(max_records)) {
    if (!reader.ReadRecord(record)) break;
    ++num_records;
    if (show_records) {
      report << "  record {\n    offset: " << record.offset << "\n";
      if (record.key != absl::nullopt) {
        report << "    key: \"" << absl::CHexEscape(*record.key) << "\"\n";
      }
      report << "    value: \"" << absl::CHexEscape(record.value) << "\"\n"
             << "  }\n";
    }
  }
  report << "  num_records: " << num_records << "\n";
  return reader.ok();
}

bool DescribeFile(absl::string_view filename, std::ostream& report) {
  report << "chunk {\n"
         << "  filename: \"" << absl::Utf8SafeCEscape(filename) << "\"\n";
  const ChunkRecordReaderBase::Options record_options =
      ChunkRecordReaderBase::Options().set_includes_keys(
          absl::GetFlag(FLAGS_includes_keys));
  bool decoded;
  absl::Status status;
  if (absl::GetFlag(FLAGS_compressed)) {
    ChunkFileReader reader(filename,
                           ChunkFileReader::Options().set_includes_keys(
                               record_options.includes_keys()));
    decoded = reader.ok() && DescribeRecords(reader, report);
    if (!reader.Close()) status = reader.status();
  } else {
    ChunkRecordReader reader(FdReader<>(filename), filename, record_options);
    decoded = reader.ok() && DescribeRecords(reader, report);
    if (!reader.Close()) status = reader.status();
  }
  if (!status.ok()) {
    const absl::optional<CorruptRecord> corrupt_record =
        GetCorruptRecord(status);
    if (corrupt_record != absl::nullopt) {
      report << "  # FILE CORRUPTED: " << status.message() << "\n";
      ABSL_LOG(WARNING) << filename << ": " << *corrupt_record;
    } else {
      report << "  # FILE READ ERROR: " << status.message() << "\n";
      ABSL_LOG(ERROR) << filename << ": " << status;
    }
  }
  report << "}\n";
  report.flush();
  return decoded && status.ok();
}

const char kUsage[] =
    "Usage: describe_chunk (OPTION|FILE)...\n"
    "\n"
    "Shows the address and records of chunk files named\n"
    "<topic>-<partition>-<start_offset>.gz.\n";

}  // namespace
}  // namespace chunkstream::tools

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(chunkstream::tools::kUsage);
  const std::vector<char*> args = absl::ParseCommandLine(argc, argv);
  bool all_ok = true;
  for (size_t i = 1; i < args.size(); ++i) {
    if (!chunkstream::tools::DescribeFile(args[i], std::cout)) all_ok = false;
  }
  return all_ok ? 0 : 1;
}
