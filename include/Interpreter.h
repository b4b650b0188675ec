#ifndef INTERPRETER_H
#define INTERPRETER_H

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class SetAPI;

class Interpreter {
   public:
    Interpreter(std::string_view dbDir);
    Interpreter(std::string_view dbDir, std::ostream& out, std::ostream& err);
    ~Interpreter();

    void processCommand(const std::string& command);
    static std::vector<std::string> tokenize(const std::string& command);

   private:
    std::unique_ptr<SetAPI> setApi;
    std::ostream& out;
    std::ostream& err;
};

#endif
