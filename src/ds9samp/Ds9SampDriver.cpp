#include "Ds9SampDriver.hpp"

#include "ArgumentParser.hpp"
#include "BatchExecutor.hpp"
#include "CommandSource.hpp"
#include "ErrorBoundary.hpp"
#include "GetExecutor.hpp"
#include "ListExecutor.hpp"
#include "LogHandler.hpp"
#include "SampHubConnector.hpp"

namespace ds9samp {
namespace {
const string GET_DESCRIPTION =
    "Send a single command to DS9 via SAMP and print out any response.\n"
    "\n"
    "Examples:\n"
    "\n"
    "    % ds9samp_get scale\n"
    "    linear\n"
    "    % ds9samp_get 'frame all'\n"
    "    1 3\n"
    "    % ds9samp_get 'frame frameno'\n"
    "    3\n";

const string SET_DESCRIPTION =
    "Send one or more commands to DS9 via SAMP. If the command begins\n"
    "with @ then it assumed to be a text file, with one command per line.\n"
    "\n"
    "Commands can be read from stdin by specifying @-.\n"
    "\n"
    "A failing command does not stop the remaining commands from being\n"
    "sent; the failures are reported once all commands have run.\n"
    "\n"
    "Examples:\n"
    "\n"
    "    % ds9samp_set 'frame frameno 2'\n"
    "    % ds9samp_set @commands\n"
    "    % ds9samp_set 'frame delete all\\nframe new'\n";

const string LIST_DESCRIPTION =
    "Display the names of the DS9 clients attached to the SAMP hub.\n"
    "\n"
    "Examples:\n"
    "\n"
    "    % ds9samp_list\n"
    "    There is one DS9 client: c1\n"
    "    % ds9samp_list\n"
    "    There are 2 DS9 clients: c1 c56\n";

unique_ptr<Ds9Session> connectToDs9(const DriverSettings& settings,
                                    HubConnector* hub, std::ostream& out) {
  auto session = hub->connect(settings.client);
  throwIfInterrupted();
  if (settings.debug) {
    out << "# Connected: " << session->describe() << endl;
  }
  return session;
}

void configureLogging(el::Configurations* defaultConf, const string& name,
                      const DriverSettings& settings) {
  el::Loggers::setVerboseLevel(settings.verbose);
  if (!settings.logdir.empty()) {
    LogHandler::setupLogFiles(defaultConf, settings.logdir, "ds9samp_" + name,
                              true);
    el::Loggers::reconfigureLogger("default", *defaultConf);
  }
}
}  // namespace

string driverName(DriverKind kind) {
  switch (kind) {
    case DriverKind::GET:
      return "get";
    case DriverKind::SET:
      return "set";
    case DriverKind::LIST:
      return "list";
  }
  return "unknown";
}

string driverDescription(DriverKind kind) {
  switch (kind) {
    case DriverKind::GET:
      return GET_DESCRIPTION;
    case DriverKind::SET:
      return SET_DESCRIPTION;
    case DriverKind::LIST:
      return LIST_DESCRIPTION;
  }
  return "";
}

void runGet(const DriverSettings& settings, HubConnector* hub,
            std::ostream& out) {
  auto session = connectToDs9(settings, hub, out);
  GetExecutor getExecutor(session.get(), settings.timeout, settings.debug,
                          out);
  getExecutor.run(settings.command);
}

void runSet(const DriverSettings& settings, HubConnector* hub,
            std::istream& in, std::ostream& out) {
  auto source = resolveCommandSource(settings.command);
  if (settings.debug) {
    if (source.type == CommandSourceType::STDIN) {
      out << "# Reading commands from stdin" << endl;
    } else if (source.type == CommandSourceType::FILE) {
      out << "# Reading commands from " << source.text << endl;
    }
  }
  // Read everything before connecting so a bad @path never touches the hub
  auto commands = readCommandBatch(source, in);
  // A control-c cuts the stdin read short, never send a partial batch
  throwIfInterrupted();

  auto session = connectToDs9(settings, hub, out);
  BatchExecutor batchExecutor(session.get(), settings.timeout, settings.debug,
                              out);
  batchExecutor.run(commands);
}

void runList(HubConnector* hub, std::ostream& out) {
  ListExecutor listExecutor(hub, out);
  listExecutor.run();
}

int driverMain(DriverKind kind, int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  LogHandler::disableLogOutput(&defaultConf);
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName("main");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  HandleTerminate();

  const string name = driverName(kind);
  installInterruptHandler(name);

  int exitCode = runWithErrorBoundary(name, [&]() {
    ArgumentParser parser("ds9samp_" + name, driverDescription(kind),
                          kind != DriverKind::LIST);
    auto action = parser.parse(argc, argv);
    if (action == ParseAction::SHOW_VERSION) {
      CLOG(INFO, "stdout") << DS9SAMP_VERSION;
      return;
    }
    if (action == ParseAction::SHOW_HELP) {
      CLOG(INFO, "stdout") << parser.help();
      return;
    }

    SampHubConnector hub;
    if (kind == DriverKind::LIST) {
      runList(&hub, std::cout);
      return;
    }

    const Invocation& invocation = parser.getInvocation();
    auto config = DriverConfig::load(
        invocation.cfgfile ? *invocation.cfgfile : DriverConfig::defaultPath(),
        invocation.cfgfile.has_value());
    auto settings = config.resolve(invocation);
    configureLogging(&defaultConf, name, settings);
    LOG(INFO) << "ds9samp_" << name << " " << DS9SAMP_VERSION
              << " timeout=" << settings.timeout;

    if (kind == DriverKind::GET) {
      runGet(settings, &hub, std::cout);
    } else {
      runSet(settings, &hub, std::cin, std::cout);
    }
  });

  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
}  // namespace ds9samp
