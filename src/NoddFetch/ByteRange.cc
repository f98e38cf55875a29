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

#include "ByteRange.hh"

using namespace NoddFetch;

std::string
ByteRange::ToCurlRange() const
{
    auto result = std::to_string(start) + "-";
    if (end) {
        result += std::to_string(*end);
    }
    return result;
}

std::string
ByteRange::ToString() const
{
    return "bytes=" + ToCurlRange();
}

bool
ByteRange::operator<(const ByteRange &other) const
{
    if (start != other.start) {
        return start < other.start;
    }
    // An open range sorts after any closed range with the same start.
    if (!end || !other.end) {
        return end.has_value() && !other.end.has_value();
    }
    return *end < *other.end;
}
