/** ProcessInspector [MailCache]
 *
 * Answers liveness questions about other processes: start-time fingerprint,
 * whether a PID belongs to this program, whether it is running at all.
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

#ifndef ProcessInspector_hpp
#define ProcessInspector_hpp

#include <stdint.h>
#include <string>

class ProcessInspector {
public:
    virtual ~ProcessInspector() {}

    virtual int currentPid() = 0;

    // Opaque start-time value for the process, or 0 when it cannot be read.
    virtual int64_t startFingerprint(int pid) = 0;

    virtual bool isOwnProcessFamily(int pid) = 0;

    virtual bool isRunning(int pid) = 0;

    // Sends SIGTERM. Returns false if the signal could not be delivered.
    virtual bool terminate(int pid) = 0;
};

class SystemProcessInspector : public ProcessInspector {
    std::string _procRoot;

    std::string readProcFile(int pid, std::string name);

public:
    SystemProcessInspector(std::string procRoot = "/proc");

    int currentPid() override;
    int64_t startFingerprint(int pid) override;
    bool isOwnProcessFamily(int pid) override;
    bool isRunning(int pid) override;
    bool terminate(int pid) override;
};

#endif /* ProcessInspector_hpp */
