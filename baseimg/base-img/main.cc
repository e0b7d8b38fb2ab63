#include "baseimg/libimage/globals.hh"
#include "baseimg/libimage/pipeline.hh"
#include "baseimg/libmain/shared.hh"
#include "baseimg/libutil/exit.hh"
#include "baseimg/libutil/file-system.hh"
#include "baseimg/libutil/json.hh"
#include "baseimg/libutil/logging.hh"
#include "baseimg/libutil/namespaces.hh"

#include <iostream>

namespace baseimg {

static void showHelp(const std::string & programName)
{
    std::cout << fmt(
        "Usage: %1% [OPTION]...\n"
        "\n"
        "Install the package manager, build the base image description inside\n"
        "an isolated namespace and write the resulting closure as an archive.\n"
        "\n"
        "  -p, --path DIR           where the store is installed (default: ./nix)\n"
        "      --show-config        print the configuration as JSON and exit\n"
        "      --option NAME VALUE  set a configuration setting\n"
        "  -v, --verbose            increase the logging verbosity\n"
        "      --quiet              decrease the logging verbosity\n"
        "      --debug              log debug messages\n"
        "      --show-trace         show every trace of an error\n"
        "      --help               show this help and exit\n"
        "      --version            show the version and exit\n",
        programName);
    throw Exit();
}

static void mainWrapped(const std::string & programName, const Strings & args)
{
    initBaseImg();

    Path basePath = "./nix";
    bool showConfig = false;

    parseCmdLine(args, [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help")
            showHelp(programName);
        else if (*arg == "--version")
            printVersion(programName);
        else if (*arg == "--path" || *arg == "-p")
            basePath = getArg(*arg, arg, end);
        else if (*arg == "--show-config")
            showConfig = true;
        else
            return false;
        return true;
    });

    if (showConfig) {
        logger->cout("%s", globalConfig.toJSON().dump(2));
        return;
    }

    checkUserNamespacePolicy();

    buildBaseImage(basePath);
}

}

int main(int argc, char * * argv)
{
    std::string programName = argc > 0 ? std::string(baseimg::baseNameOf(argv[0])) : "base-img";
    baseimg::Strings args;
    for (int i = 1; i < argc; ++i)
        args.push_back(argv[i]);

    return baseimg::handleExceptions(programName, [&]() {
        baseimg::mainWrapped(programName, args);
    });
}
