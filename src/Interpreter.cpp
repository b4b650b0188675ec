#include "Interpreter.h"
#include <boost/algorithm/string.hpp>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "Api.h"
#include "utils.h"

using namespace std;

Interpreter::Interpreter(string_view dbDir) : Interpreter(dbDir, cout, cerr) {}

Interpreter::Interpreter(string_view dbDir, ostream &out, ostream &err)
    : setApi(make_unique<SetAPI>(string(dbDir), out, err)),
      out(out),
      err(err) {}

Interpreter::~Interpreter() = default;

vector<string> Interpreter::tokenize(const string &command) {
    vector<string> tokens;
    istringstream stream(command);
    string token;

    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

void Interpreter::processCommand(const string &command) {
    vector<string> tokens = tokenize(command);

    if (tokens.empty()) {
        out << "Empty command." << endl;
        return;
    }

    boost::algorithm::to_lower(tokens[0]);

    string operation = tokens[0];
    vector<string> args(tokens.begin() + 1, tokens.end());

    if (operation == "sadd" && args.size() >= 2) {
        setApi->addOp(args[0], vector<string>(args.begin() + 1, args.end()));

    } else if (operation == "srem" && args.size() >= 2) {
        setApi->removeOp(args[0], vector<string>(args.begin() + 1, args.end()));

    } else if (operation == "smembers" && args.size() == 1) {
        setApi->membersOp(args[0]);

    } else if (operation == "scard" && args.size() == 1) {
        setApi->cardOp(args[0]);

    } else if (operation == "sismember" && args.size() == 2) {
        setApi->isMemberOp(args[0], args[1]);

    } else if (operation == "exists" && !args.empty()) {
        setApi->existsOp(args);

    } else if (operation == "del" && !args.empty()) {
        setApi->deleteOp(args);

    } else if (operation == "sinter" && !args.empty()) {
        setApi->algebraOp(SetOperation::Intersect, args);

    } else if (operation == "sunion" && !args.empty()) {
        setApi->algebraOp(SetOperation::Union, args);

    } else if (operation == "sdiff" && !args.empty()) {
        setApi->algebraOp(SetOperation::Difference, args);

    } else if (operation == "sinterstore" && args.size() >= 2) {
        setApi->storeOp(SetOperation::Intersect, args[0],
                        vector<string>(args.begin() + 1, args.end()));

    } else if (operation == "sunionstore" && args.size() >= 2) {
        setApi->storeOp(SetOperation::Union, args[0],
                        vector<string>(args.begin() + 1, args.end()));

    } else if (operation == "sdiffstore" && args.size() >= 2) {
        setApi->storeOp(SetOperation::Difference, args[0],
                        vector<string>(args.begin() + 1, args.end()));

    } else if (operation == "smove" && args.size() == 3) {
        setApi->moveOp(args[0], args[1], args[2]);

    } else if (operation == "keyslot" && args.size() == 1) {
        setApi->keySlotOp(args[0]);

    } else if (operation == "nodes" && args.empty()) {
        setApi->nodesOp();

    } else if (operation == "down" && args.size() == 1) {
        setApi->nodeStateOp(args[0], true);

    } else if (operation == "up" && args.size() == 1) {
        setApi->nodeStateOp(args[0], false);

    } else if (operation == "help") {
        printUsage(out);
    } else {
        err << "Unknown command \"" << operation
            << "\" or wrong number of arguments\nType \"help\" for usage"
            << endl;
    }
}
