// include/main.h
#ifndef MAIN_H
#define MAIN_H
#include <array>
#include <string_view>

using namespace std;

constexpr array<string_view, 2> config_dir = {".config", "clusterset"};
constexpr string_view histfile = ".clustersethistory";

/* holds nodes.conf and one <host>_<port>.csv per node */
constexpr string_view dbDir = "./database/";

#endif /* MAIN_H */
