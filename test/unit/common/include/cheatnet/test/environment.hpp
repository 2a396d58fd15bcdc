// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <gtest/gtest.h>

#include <cheatnet/core/config.hpp>

#include <quill/Quill.h>

CHEATNET_NAMESPACE_BEGIN

namespace test
{
    class Environment : public ::testing::Environment
    {
    public:
        void SetUp() override
        {
            quill::start(true);
            quill::get_root_logger()->set_log_level(quill::LogLevel::Warning);
        }

        void TearDown() override
        {
            quill::flush();
        }
    };
}

CHEATNET_NAMESPACE_END
