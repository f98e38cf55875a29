/***************************************************************
 *
 * Copyright (C) 2025, Pelican Project, Morgridge Institute for Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you
 * may not use this file except in compliance with the License.  You may
 * obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 ***************************************************************/

#include "NoddFetch/RunCycle.hh"

#include <gtest/gtest.h>

using namespace NoddFetch;

namespace {

TimePoint At(const std::string &yyyymmddhh, int minutes = 0)
{
    TimePoint tp;
    EXPECT_TRUE(ParseRunTime(yyyymmddhh, tp)) << yyyymmddhh;
    return tp + std::chrono::minutes(minutes);
}

}

TEST(RunCycle, ReferenceTimes) {
    auto ref = ReferenceTimes::FromNow(At("2025013107", 25));
    EXPECT_EQ(ref.year, "2025");
    EXPECT_EQ(ref.day, "20250131");
    EXPECT_EQ(ref.prev_hr, "06");
    EXPECT_EQ(ref.day_sub3h, "20250131");
    EXPECT_EQ(ref.two_hrs_back, "2025013105");
    EXPECT_EQ(ref.last_gfs_run, "00");
    EXPECT_EQ(ref.last_ofs_run, "2025013100");
}

TEST(RunCycle, ReferenceTimesAcrossMidnight) {
    auto ref = ReferenceTimes::FromNow(At("2025020101", 30));
    EXPECT_EQ(ref.year, "2025");
    EXPECT_EQ(ref.day, "20250201");
    EXPECT_EQ(ref.prev_hr, "00");
    EXPECT_EQ(ref.day_sub3h, "20250131");
    EXPECT_EQ(ref.two_hrs_back, "2025013123");
    EXPECT_EQ(ref.last_gfs_run, "18");
    EXPECT_EQ(ref.last_ofs_run, "2025013118");

    ref = ReferenceTimes::FromNow(At("2025010100", 10));
    EXPECT_EQ(ref.year, "2024");
    EXPECT_EQ(ref.day, "20241231");
    EXPECT_EQ(ref.prev_hr, "23");
}

TEST(RunCycle, HourlyProductIsPreviousHour) {
    for (const auto &now : {At("2025013107", 0), At("2025013107", 59), At("2025020100", 1), At("2024022923", 45)}) {
        TimePoint run;
        std::string err;
        ASSERT_TRUE(ResolveLatestRun("{day}{prev_hr}", "sfc", now, run, err)) << err;
        EXPECT_EQ(run, TruncateToHour(now) - std::chrono::hours(1));
    }
}

TEST(RunCycle, SixHourlyProducts) {
    TimePoint run;
    std::string err;
    ASSERT_TRUE(ResolveLatestRun("{day_sub3h:s}{last_gfs_run:s}", "0p25", At("2025020101", 30), run, err)) << err;
    EXPECT_EQ(run, At("2025013118"));

    ASSERT_TRUE(ResolveLatestRun("{last_ofs_run}", "natlev", At("2025013114", 10), run, err)) << err;
    EXPECT_EQ(run, At("2025013112"));

    // 2.1 hours before 14:05 is 11:59, still in the 06 cycle.
    ASSERT_TRUE(ResolveLatestRun("{last_ofs_run}", "natlev", At("2025013114", 5), run, err)) << err;
    EXPECT_EQ(run, At("2025013106"));

    ASSERT_TRUE(ResolveLatestRun("{two_hrs_back}", "natlev", At("2025013114", 5), run, err)) << err;
    EXPECT_EQ(run, At("2025013112"));
}

TEST(RunCycle, InvalidTemplates) {
    TimePoint run;
    std::string err;
    EXPECT_FALSE(ResolveLatestRun("{day}", "sfc", At("2025013107"), run, err));
    EXPECT_NE(err.find("YYYYMMDDHH"), std::string::npos);

    err.clear();
    EXPECT_FALSE(ResolveLatestRun("{unknown_field}", "sfc", At("2025013107"), run, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(ResolveLatestRun("{day", "sfc", At("2025013107"), run, err));
    EXPECT_FALSE(err.empty());
}

TEST(RunCycle, WindowDefaults) {
    Window window;
    std::string err;
    auto now = At("2025013107", 25);

    ASSERT_TRUE(ResolveWindow("{day}{prev_hr}", "sfc", now, std::nullopt, std::nullopt, 1, 0, window, err)) << err;
    EXPECT_EQ(window.start, At("2025013106"));
    EXPECT_EQ(window.end, At("2025013107"));

    ASSERT_TRUE(ResolveWindow("{day}{prev_hr}", "sfc", now, At("2025010100"), std::nullopt, 6, 0, window, err));
    EXPECT_EQ(window.start, At("2025010100"));
    EXPECT_EQ(window.end, At("2025010106"));

    ASSERT_TRUE(ResolveWindow("{day}{prev_hr}", "sfc", now, At("2025010100"), At("2025010200"), 6, 0, window,
        err));
    EXPECT_EQ(window.end, At("2025010200"));
}

TEST(RunCycle, CyclesBackShiftsStart) {
    Window plain, shifted;
    std::string err;
    auto now = At("2025013114", 10);

    ASSERT_TRUE(ResolveWindow("{last_ofs_run}", "natlev", now, std::nullopt, std::nullopt, 6, 0, plain, err));
    ASSERT_TRUE(ResolveWindow("{last_ofs_run}", "natlev", now, std::nullopt, std::nullopt, 6, 2, shifted, err));
    EXPECT_EQ(plain.start - shifted.start, std::chrono::hours(12));
    // The end is defaulted from the unshifted start, so the window grows.
    EXPECT_EQ(shifted.end, plain.end);
    EXPECT_EQ(shifted.end - shifted.start, std::chrono::hours(18));
}

TEST(RunCycle, ParseDate) {
    TimePoint tp;
    ASSERT_TRUE(ParseDate("2025-01-31", tp));
    EXPECT_EQ(tp, At("2025013100"));
    ASSERT_TRUE(ParseDate("2025-01-31-12", tp));
    EXPECT_EQ(tp, At("2025013112"));
    ASSERT_TRUE(ParseDate("2025-01-31T18", tp));
    EXPECT_EQ(tp, At("2025013118"));
    EXPECT_EQ(FormatTime(tp, "%Y-%m-%d-%H"), "2025-01-31-18");

    EXPECT_FALSE(ParseDate("2025/01/31", tp));
    EXPECT_FALSE(ParseDate("2025-01-31-25", tp));
    EXPECT_FALSE(ParseDate("2025-01-3", tp));
    EXPECT_FALSE(ParseDate("", tp));
}
