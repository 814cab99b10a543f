/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <memory>

#include <folly/Benchmark.h>
#include <folly/init/Init.h>

#include "tempo/type/CalendarDateTime.h"
#include "tempo/type/FixedDateTime.h"

using namespace facebook::tempo;

namespace {

constexpr int kIterations = 100'000;

// Compares the civil date/time type against the fixed-width counters on the
// same workload: stepping through a year one minute at a time.
class DateTimeBenchmark {
 public:
  DateTimeBenchmark() : newYork_(*TimeZone::lookup("America/New_York")) {}

  void calendarAdd() {
    CalendarDateTime dt(2024, 1, 1);
    for (auto i = 0; i < kIterations; ++i) {
      dt = dt.add({.minutes = 1});
    }
    folly::doNotOptimizeAway(dt);
  }

  void calendarToUtc() {
    const CalendarDateTime dt(2024, 7, 1, 12, 0, 0, 0, 0, 0, newYork_);
    for (auto i = 0; i < kIterations; ++i) {
      folly::doNotOptimizeAway(dt.toUtc());
    }
  }

  template <typename T>
  void fixedAdd(bool rehash) {
    auto dt = T::fromFields(2024, 1, 1);
    for (auto i = 0; i < kIterations; ++i) {
      dt.add({.minutes = 1});
      if (rehash) {
        dt.rehash();
      }
    }
    folly::doNotOptimizeAway(dt);
  }

  void dayOfWeek() {
    uint64_t sum = 0;
    for (auto i = 0; i < kIterations; ++i) {
      sum += kGregorianCalendar.dayOfWeek(1 + i % 9999, 1 + i % 12, 1 + i % 28);
    }
    folly::doNotOptimizeAway(sum);
  }

  void parseIso() {
    for (auto i = 0; i < kIterations; ++i) {
      folly::doNotOptimizeAway(
          facebook::tempo::parseIso("2024-07-01T12:30:45", IsoFormat::kFull));
    }
  }

 private:
  const TimeZone newYork_;
};

std::unique_ptr<DateTimeBenchmark> bm;

BENCHMARK(calendarDateTimeAdd) {
  bm->calendarAdd();
}

BENCHMARK_RELATIVE(fixedDateTime64Add) {
  bm->fixedAdd<FixedDateTime64>(false);
}

BENCHMARK_RELATIVE(fixedDateTime64AddRehash) {
  bm->fixedAdd<FixedDateTime64>(true);
}

BENCHMARK_RELATIVE(fixedDateTime32AddRehash) {
  bm->fixedAdd<FixedDateTime32>(true);
}

BENCHMARK_DRAW_LINE();

BENCHMARK(calendarDateTimeToUtc) {
  bm->calendarToUtc();
}

BENCHMARK(gregorianDayOfWeek) {
  bm->dayOfWeek();
}

BENCHMARK(parseIsoFull) {
  bm->parseIso();
}

} // namespace

int main(int argc, char** argv) {
  folly::Init init(&argc, &argv);

  bm = std::make_unique<DateTimeBenchmark>();
  folly::runBenchmarks();
  bm.reset();

  return 0;
}
