#include "CommandCatalog.hpp"

#include "Errors.hpp"
#include "ServerConfig.hpp"

namespace rx {
const char *IniCommandCatalog::SECTION_PREFIX = "command:";

Command CommandCatalog::getDefaultCommand() {
  vector<Command> all = getCommands();
  if (all.empty()) {
    throw NotFoundError("command", "default");
  }
  return all.front();
}

IniCommandCatalog::IniCommandCatalog(const CSimpleIniA &ini) {
  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  const string prefix = SECTION_PREFIX;
  for (const auto &entry : sections) {
    string section = entry.pItem;
    if (section.compare(0, prefix.length(), prefix) != 0) {
      continue;
    }
    string id = trim(section.substr(prefix.length()));
    if (id.empty()) {
      throw std::runtime_error("Command section without an id: " + section);
    }
    const char *s = section.c_str();

    Command command;
    command.set_id(id);
    command.set_name(ServerConfig::getString(ini, s, "name", id));
    command.set_command(ServerConfig::getString(ini, s, "command", ""));
    if (command.command().empty()) {
      throw std::runtime_error("Command " + id + " has no command line");
    }
    command.set_working_dir(ServerConfig::getString(ini, s, "working_dir", "/"));
    int64_t timeout = ServerConfig::getInt(ini, s, "timeout", 0);
    if (timeout < 0) {
      throw std::runtime_error("Command " + id + " has a negative timeout");
    }
    command.set_timeout_seconds(int32_t(timeout));
    command.set_description(ServerConfig::getString(ini, s, "description", ""));
    command.set_sort_order(int32_t(ServerConfig::getInt(ini, s, "sort_order", 0)));
    addCommand(command);
  }
  LOG(INFO) << "Loaded " << commands.size() << " commands";
}

IniCommandCatalog::IniCommandCatalog(const vector<Command> &_commands) {
  for (const auto &command : _commands) {
    addCommand(command);
  }
}

void IniCommandCatalog::addCommand(const Command &command) {
  lock_guard<std::mutex> guard(catalogMutex);
  if (commands.find(command.id()) != commands.end()) {
    throw std::runtime_error("Duplicate command id: " + command.id());
  }
  commands[command.id()] = command;
}

Command IniCommandCatalog::getCommandById(const string &id) {
  lock_guard<std::mutex> guard(catalogMutex);
  auto it = commands.find(id);
  if (it == commands.end()) {
    throw NotFoundError("command", id);
  }
  return it->second;
}

vector<Command> IniCommandCatalog::getCommands() {
  vector<Command> result;
  {
    lock_guard<std::mutex> guard(catalogMutex);
    for (const auto &it : commands) {
      result.push_back(it.second);
    }
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const Command &a, const Command &b) {
                     return a.sort_order() < b.sort_order();
                   });
  return result;
}
}  // namespace rx
