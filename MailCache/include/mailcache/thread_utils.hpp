/** ThreadUtils [MailCache]
 *
 * Thread names for log output, and the signal mask the daemon's threads
 * share.
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef ThreadUtils_hpp
#define ThreadUtils_hpp

#include <string>
#include <signal.h>

std::string GetThreadName(size_t spdlog_thread_id);
void SetThreadName(const char* threadName);

/*
 Blocks SIGTERM and SIGINT in the calling thread and returns that set for
 sigwait. Threads inherit the mask of the thread that creates them, so this
 has to run before any other thread (including the log flusher) exists.
 */
sigset_t BlockStopSignals();

#endif /* ThreadUtils_hpp */
