// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <fmt/format.h>
#include <fmt/chrono.h>

#include <modern-ulid/ulid.h>
#include <modern-ulid/monotonic.h>

#include <vector>

using namespace mulid;

int main() {

    //A new ULID for the current time
    auto id = ulid::generate();
    fmt::print("generated:       {}\n", id);
    fmt::print("lowercase:       {:l}\n", id);
    fmt::print("time:            {} ({})\n", id.time(), id.time_point());

    //A ULID for a specific time
    auto when = std::chrono::system_clock::now() - std::chrono::hours(24);
    auto yesterday = ulid::generate(when);
    fmt::print("yesterday:       {}\n", yesterday);

    //Parsing
    ulid parsed;
    if (auto err = ulid::parse_strict("01ARZ3NDEKTSV4RRFFQ69G5FAV", parsed); err != errc{}) {
        fmt::print(stderr, "parse failed: {}\n", make_error_code(err).message());
        return 1;
    }
    fmt::print("parsed:          {} at {}\n", parsed, parsed.time());

    ulid bad;
    auto err = ulid::parse_strict("01ARZ3NDEKTSV4RRFFQ69G5FAI", bad);
    fmt::print("bad input:       {}\n", make_error_code(err).message());

    //Comparison and sorting
    fmt::print("yesterday < now: {}\n", yesterday < id);
    fmt::print("compare:         {}\n", parsed.compare(id));

    //Monotonic entropy for many ULIDs within the same millisecond
    auto ms = timestamp(std::chrono::system_clock::now());
    monotonic_entropy mono(ms);
    std::vector<ulid> batch;
    for (int i = 0; i < 5; ++i)
        batch.push_back(ulid::make(ms, mono));
    for (auto & item: batch)
        fmt::print("monotonic:       {}\n", item);
    fmt::print("sorted:          {}\n", std::is_sorted(batch.begin(), batch.end()));

    //Changing the time
    ulid moved = parsed;
    if (moved.set_time(ms) == errc{})
        fmt::print("moved:           {}\n", moved);
    if (auto res = moved.set_time(ulid::max_time + 1); res != errc{})
        fmt::print("too large:       {}\n", make_error_code(res).message());

    //Nil checks
    ulid empty;
    fmt::print("nil:             {} is_nil={}\n", empty, empty.is_nil());
    fmt::print("max:             {}\n", ulid::max());
    fmt::print("json:            {}\n", parsed.marshal_json());
}
