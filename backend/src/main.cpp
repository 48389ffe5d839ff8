#include "app/DaemonMain.hpp"

int main(int argc, char *argv[])
{
    return tl::app::daemon_main(argc, argv);
}
