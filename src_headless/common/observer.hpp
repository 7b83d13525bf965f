#pragma once

#include <iostream>
#include <string>
#include <vector>

// Progress sink for the training and rollout loops. report() returning false
// asks the running loop to stop and hand back what it has so far.
class Observer {
   public:
    virtual ~Observer() {}

    // One frame per environment step
    virtual bool report(const std::string& title, const std::string& subtitle,
                        const std::vector<std::string>& details) = 0;

    // End of an episode or of a whole run
    virtual bool summary(const std::string& title, const std::string& subtitle) {
        return report(title, subtitle, std::vector<std::string>());
    }

    virtual void close() {}
};

// Prints summaries to stdout; per-step frames only when verbose
class ConsoleObserver : public Observer {
   public:
    explicit ConsoleObserver(bool verbose = false, std::ostream& out = std::cout) : verbose(verbose), out(out) {}

    bool report(const std::string& title, const std::string& subtitle,
                const std::vector<std::string>& details) override {
        if (!verbose)
            return true;
        out << title << "  " << subtitle << std::endl;
        for (const std::string& line : details) {
            out << "    " << line << std::endl;
        }
        return true;
    }

    bool summary(const std::string& title, const std::string& subtitle) override {
        out << title << "  " << subtitle << std::endl;
        return true;
    }

   private:
    bool verbose;
    std::ostream& out;
};
