#pragma once

#include <cstdint>
#include <string>

namespace threadnet::db::model {

/*
  Persistent dataset row.

  - tlv is the hex string exactly as submitted
  - created_at_us is unix microseconds, UTC
*/

struct DatasetRecord {
  std::string id;  // ULID, 26 chars
  std::string source;
  std::string tlv;

  int64_t created_at_us = 0;
};

}
