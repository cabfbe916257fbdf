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

#include <ethkit/core/config.hpp>
#include <ethkit/core/log.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/handlers/Handler.h>

#include <memory>
#include <mutex>

ETHKIT_NAMESPACE_BEGIN

void init_logging(quill::LogLevel const level)
{
    static std::once_flag configured;
    std::call_once(configured, [] {
        std::shared_ptr<quill::Handler> stdout_handler =
            quill::stdout_handler();
        stdout_handler->set_pattern(
            "%(time) [%(thread_id)] %(file_name):%(line_number) "
            "LOG_%(log_level)\t"
            "%(message)",
            "%Y-%m-%d %H:%M:%S.%Qns",
            quill::Timezone::GmtTime);
        quill::Config cfg;
        cfg.default_handlers.emplace_back(std::move(stdout_handler));
        quill::configure(cfg);
        quill::start(true);
    });
    quill::get_root_logger()->set_log_level(level);
}

ETHKIT_NAMESPACE_END
