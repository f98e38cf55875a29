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

#include "NoddFetch/KeyTemplate.hh"

#include <gtest/gtest.h>

using namespace NoddFetch;

namespace {

KeyFields Fields(const std::string &cycle, unsigned fxx, std::optional<unsigned> mem, const std::string &prod_type)
{
    KeyFields fields;
    EXPECT_TRUE(ParseRunTime(cycle, fields.cycle));
    fields.fxx = fxx;
    fields.mem = mem;
    fields.prod_type = prod_type;
    return fields;
}

}

TEST(KeyTemplate, HrrrKey) {
    std::string result, err;
    ASSERT_TRUE(RenderTemplate("hrrr.{day:s}/conus/hrrr.t{hr:02d}z.wrf{prod_type}f{fxx:02d}.grib2",
        Fields("2025013106", 7, std::nullopt, "sfc"), result, err)) << err;
    EXPECT_EQ(result, "hrrr.20250131/conus/hrrr.t06z.wrfsfcf07.grib2");
}

TEST(KeyTemplate, OdsName) {
    std::string result, err;
    ASSERT_TRUE(RenderTemplate("{day}_{hr:02d}00/{yyjjj}{hr:02d}000{fxx:03d}",
        Fields("2025020112", 48, std::nullopt, "0p25"), result, err)) << err;
    EXPECT_EQ(result, "20250201_1200/2503212000048");
}

TEST(KeyTemplate, EnsembleMember) {
    std::string result, err;
    ASSERT_TRUE(RenderTemplate(
        "rrfs_a/rrfs_a.{day:s}/{hr:02d}/mem{mem:04d}/rrfs.t{hr:02d}z.m{mem:02d}.{prod_type}.f{fxx:03d}.conus.grib2",
        Fields("2024053018", 1, 3, "prslev"), result, err)) << err;
    EXPECT_EQ(result, "rrfs_a/rrfs_a.20240530/18/mem0003/rrfs.t18z.m03.prslev.f001.conus.grib2");

    ASSERT_TRUE(RenderTemplate("m{mem:02d}/{year}", Fields("2024053018", 1, std::nullopt, ""), result, err));
    EXPECT_EQ(result, "m00/2024");
}

TEST(KeyTemplate, Errors) {
    std::string result, err;
    EXPECT_FALSE(RenderTemplate("{cycle}", Fields("2025013106", 0, std::nullopt, ""), result, err));
    EXPECT_NE(err.find("{cycle}"), std::string::npos);

    err.clear();
    EXPECT_FALSE(RenderTemplate("{fxx:s}", Fields("2025013106", 0, std::nullopt, ""), result, err));
    EXPECT_FALSE(err.empty());
}

TEST(KeyTemplate, ParentPath) {
    EXPECT_EQ(ParentPath("a/b/c.grib2"), "a/b");
    EXPECT_EQ(ParentPath("c.grib2"), "");
    EXPECT_EQ(ParentPath("a/"), "a");
}
