#include "PL/AST.hpp"
#include "PL/Parser.hpp"
#include "PL/Runtime/RuleDependencyGraph.hpp"
#include "PL/Runtime/RuleTheory.hpp"
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Session {
  pl::RuleTheory theory;
  pl::RuleDependencyGraph graph;
  pl::TheoryRegistry registry;
};

std::optional<pl::RuleTheory> makeTheory(const std::string &kind, const std::string &name) {
  if (kind == "nonrecursive") return pl::makeNonrecursiveTheory(name);
  if (kind == "action") return pl::makeActionTheory(name);
  if (kind == "unsafe") return pl::makeUnsafeTheory(name);
  return std::nullopt;
}

void printRules(const std::vector<pl::Rule> &rules) {
  if (rules.empty()) {
    std::cout << "(none)" << std::endl;
    return;
  }
  for (const auto &r : rules) std::cout << "  " << pl::toString(r) << std::endl;
}

void printTables(const pl::RuleTheory &theory) {
  for (const auto &table : theory.definedTablenames()) {
    std::cout << "  " << table << "/" << theory.arity(table).value_or(0) << std::endl;
  }
}

void printStrata(const pl::RuleDependencyGraph &graph) {
  const auto strata = graph.stratify();
  if (!strata) {
    std::cout << "Not stratified: negation is recursive." << std::endl;
    return;
  }
  // Sorted for stable output
  const std::map<std::string, int> sorted(strata->begin(), strata->end());
  for (const auto &[table, level] : sorted) {
    std::cout << "  " << table << ": " << level << std::endl;
  }
}

void printCycles(const pl::RuleDependencyGraph &graph) {
  if (!graph.isRecursive()) {
    std::cout << "No cycles." << std::endl;
    return;
  }
  for (const auto &cycle : graph.cycles()) {
    std::cout << "  ";
    for (size_t i = 0; i < cycle.size(); ++i) {
      if (i) std::cout << " -> ";
      std::cout << cycle[i];
    }
    std::cout << " -> " << cycle.front() << std::endl;
  }
}

// Validate, then apply; returns false if validation failed
bool applyEvents(Session &s, const std::vector<pl::Event> &events) {
  const auto errors = s.theory.updateWouldCauseErrors(events);
  if (!errors.empty()) {
    for (const auto &e : errors) {
      std::cerr << "Error (line " << e.loc.line << "): " << e.message << std::endl;
    }
    return false;
  }
  const auto changes = s.theory.update(events);
  s.graph.apply(changes);
  std::cout << changes.size() << " change(s)" << std::endl;
  return true;
}

/// Loads the given '.dl' file as one batch and reports on it
int runFile(const std::string &fileName, Session &s) {
  try {
    const auto formulas = pl::parseFile(fileName);
    std::vector<pl::Event> events;
    for (const auto &f : formulas) events.push_back(pl::Event{f, true});
    const auto errors = s.theory.updateWouldCauseErrors(events);
    for (const auto &e : errors) {
      std::cerr << fileName << ":" << e.loc.line << ":" << e.loc.column << ": " << e.message << std::endl;
    }
    if (!errors.empty()) return 1;

    s.theory.define(formulas);
    s.graph = pl::RuleDependencyGraph(s.theory.content());

    std::cout << "Loaded " << s.theory.size() << " rule(s) into " << pl::toString(s.theory.kind())
              << " theory" << std::endl;
    std::cout << "\nContent:" << std::endl;
    printRules(s.theory.content());
    std::cout << "\nTables:" << std::endl;
    printTables(s.theory);
    std::cout << "\nStrata:" << std::endl;
    printStrata(s.graph);
    return 0;
  } catch (const pl::ParseError &e) {
    std::cerr << e.what() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Load error: " << e.what() << std::endl;
  }
  return 1;
}

std::string replHelp() {
  return "\nPolicyLogic shell\n"
         "Available commands:\n"
         "  \\h               Show this help message\n"
         "  \\q               Quit\n"
         "  \\content         List all rules and facts\n"
         "  \\policy          List rules (facts excluded)\n"
         "  \\tables          List defined tables with their arity\n"
         "  \\strata          Show the stratification of the table dependencies\n"
         "  \\cycles          Show recursive table dependencies\n"
         "  \\delete <rule>   Delete a rule or fact\n"
         "  \\check <rule>    Report the errors inserting a rule would cause\n"
         "  \\clear           Remove everything\n"
         "  \\debug           Toggle debug logging\n"
         "\nAny other line is inserted as a rule or fact.\n";
}

bool handleCommand(const std::string &line, Session &s, bool &shouldQuit) {
  if (line.empty()) {
    return true;
  }

  try {
    if (line[0] == '\\') {
      const auto space = line.find(' ');
      const std::string cmd = line.substr(0, space);
      const std::string arg = space == std::string::npos ? "" : line.substr(space + 1);

      if (cmd == "\\q" || cmd == "\\quit") {
        shouldQuit = true;
        std::cout << "Goodbye!" << std::endl;
      } else if (cmd == "\\h" || cmd == "\\help") {
        std::cout << replHelp();
      } else if (cmd == "\\content") {
        printRules(s.theory.content());
      } else if (cmd == "\\policy") {
        printRules(s.theory.policy());
      } else if (cmd == "\\tables") {
        printTables(s.theory);
      } else if (cmd == "\\strata") {
        printStrata(s.graph);
      } else if (cmd == "\\cycles") {
        printCycles(s.graph);
      } else if (cmd == "\\delete") {
        return applyEvents(s, {pl::Event{pl::parseFormula(arg), false}});
      } else if (cmd == "\\check") {
        const auto errors = s.theory.updateWouldCauseErrors({pl::Event{pl::parseFormula(arg), true}});
        if (errors.empty()) std::cout << "No errors." << std::endl;
        for (const auto &e : errors) std::cout << "  " << e.message << std::endl;
      } else if (cmd == "\\clear" || cmd == "\\reset") {
        s.theory.clear();
        s.graph = pl::RuleDependencyGraph();
        std::cout << "Theory cleared." << std::endl;
      } else if (cmd == "\\debug") {
        s.theory.setDebug(!s.theory.debug());
        std::cout << "Debug mode: " << (s.theory.debug() ? "ON" : "OFF") << std::endl;
      } else {
        std::cerr << "Unknown command: " << line << std::endl;
        std::cout << "Type \\h for help." << std::endl;
        return false;
      }
      return true;
    }

    return applyEvents(s, {pl::Event{pl::parseFormula(line), true}});
  } catch (const pl::ParseError &e) {
    std::cerr << e.what() << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return false;
  }
}

/**
 * Starts the REPL (Read-Eval-Print Loop)
 */
void runRepl(Session &s) {
  bool shouldQuit = false;

  std::cout << "PolicyLogic shell v0.1" << std::endl;
  std::cout << "Type \\h for help, \\q to quit." << std::endl;

  while (!shouldQuit) {
    std::cout << "\n> ";

    std::string line;
    if (!std::getline(std::cin, line)) {
      break;
    }

    handleCommand(line, s, shouldQuit);
  }
}

const char *kUsage = "Usage: policylogic [--debug|-d] [--kind nonrecursive|action|unsafe] [--name theory] [file.dl]\n";

} // namespace

int main(const int argc, char **argv) {

  // Parse optional flags
  bool debug = false;
  std::string kind = "nonrecursive";
  std::string name = "policy";
  int argi = 1;
  while (argi < argc && argv[argi][0] == '-') {
    const std::string opt = argv[argi];
    if (opt == "--debug" || opt == "-d") {
      debug = true;
      ++argi;
      continue;
    }
    if (opt == "--kind" && argi + 1 < argc) {
      kind = argv[argi + 1];
      argi += 2;
      continue;
    }
    if (opt == "--name" && argi + 1 < argc) {
      name = argv[argi + 1];
      argi += 2;
      continue;
    }
    std::cerr << "Unknown option: " << opt << "\n";
    std::cerr << kUsage;
    return 1;
  }

  auto theory = makeTheory(kind, name);
  if (!theory) {
    std::cerr << "Unknown theory kind: " << kind << "\n";
    std::cerr << kUsage;
    return 1;
  }
  Session session{std::move(*theory), pl::RuleDependencyGraph(), {}};
  pl::registerTheory(session.registry, session.theory);
  session.theory.setDebug(debug);

  if (argi < argc) {
    const std::string fileName = argv[argi];

    if (fileName.size() < 3 || fileName.substr(fileName.size() - 3) != ".dl") {
      std::cout << "Invalid file extension" << std::endl;
      return 1;
    }

    return runFile(fileName, session);
  }

  runRepl(session);
  return 0;
}
