#include "utils.h"
#include <iostream>
#include <string>

using namespace std;

string bold(const string& text) {
    return BOLD + text + RESET;
}

void printUsage(ostream& out) {
    out << "Usage:\n"
        << bold("sadd <key> <member...>")
        << "\n\tAdd members to the set stored at <key>\n"
        << bold("srem <key> <member...>")
        << "\n\tRemove members from the set stored at <key>\n"
        << bold("smembers <key>") << "\n\tList the members of <key>\n"
        << bold("scard <key>") << "\n\tNumber of members of <key>\n"
        << bold("sismember <key> <member>")
        << "\n\t1 if <member> belongs to <key>, 0 otherwise\n"
        << bold("exists <key...>") << "\n\tNumber of the given keys that exist\n"
        << bold("del <key...>") << "\n\tDelete keys\n\n"
        << bold("sinter <key...>") << "\n\tIntersection of all sets\n"
        << bold("sunion <key...>") << "\n\tUnion of all sets\n"
        << bold("sdiff <key> <key...>")
        << "\n\tMembers of the first set not present in any of the others\n"
        << bold("sinterstore <dest> <key...>") << ", "
        << bold("sunionstore <dest> <key...>") << ", "
        << bold("sdiffstore <dest> <key...>")
        << "\n\tStore the result in <dest>. When the keys span shards the "
           "result is added to <dest>\n"
        << bold("smove <source> <dest> <member>")
        << "\n\tMove <member> from <source> to <dest>. Not atomic when the "
           "keys hash to different slots\n\n"
        << bold("keyslot <key>")
        << "\n\tHash slot of <key> and the node serving it\n"
        << bold("nodes") << "\n\tList cluster nodes, their slots and state\n"
        << bold("down <host>:<port>") << ", " << bold("up <host>:<port>")
        << "\n\tMark a node unreachable or reachable again\n"
        << bold("exit") << "\n\tLeave the shell" << endl;
}
