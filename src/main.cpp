#include "app/Application.hpp"
#include "monitor/MonitorService.hpp"

#include <cstring>

int main(int argc, char** argv)
{
    // Monitor mode - started by the generated launcher script under launchd
    if (argc >= 2 && std::strcmp(argv[1], focusguard::MonitorService::kInternalModeFlag) == 0)
    {
        return focusguard::MonitorService::RunMonitorProcess(argc, argv);
    }

    // Command dispatcher mode
    return focusguard::Application::Main(argc, argv);
}
