#ifndef __RX_COMMAND_CATALOG__
#define __RX_COMMAND_CATALOG__

#include "Headers.hpp"
#include "SimpleIni.h"

namespace rx {
/**
 * @brief Source of the commands operators are allowed to run.
 */
class CommandCatalog {
 public:
  virtual ~CommandCatalog() {}

  /** @throws NotFoundError */
  virtual Command getCommandById(const string &id) = 0;

  /** @brief All commands ordered by sort_order, then id. */
  virtual vector<Command> getCommands() = 0;

  /**
   * @brief Command with the lowest sort_order, ties broken by id.
   * @throws NotFoundError if the catalog is empty.
   */
  Command getDefaultCommand();
};

/**
 * @brief Catalog read once from `[command:<id>]` sections of the config.
 */
class IniCommandCatalog : public CommandCatalog {
 public:
  static const char *SECTION_PREFIX;

  /** @throws std::runtime_error for a section without a command line. */
  explicit IniCommandCatalog(const CSimpleIniA &ini);

  explicit IniCommandCatalog(const vector<Command> &_commands);

  virtual Command getCommandById(const string &id);

  virtual vector<Command> getCommands();

 protected:
  void addCommand(const Command &command);

  std::mutex catalogMutex;
  map<string, Command> commands;
};
}  // namespace rx

#endif  // __RX_COMMAND_CATALOG__
