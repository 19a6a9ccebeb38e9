// odict-merge - merge JSON documents with OrderedDictionary::mergeWith

#include <od/cli_args.h>
#include <od/dictionary.h>
#include <od/json.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
    // I/O failures map to exit code 2, like usage errors.
    struct IoError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    std::string readFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) throw IoError("cannot open file: " + path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
}

int main(int argc, const char* argv[]) {
    try {
        od::cli::CliArgs args(argc, argv);

        if (args.getAction() == od::cli::CliArgs::Action::HELP) {
            std::cout << od::cli::CliArgs::usage();
            return 0;
        }

        const bool verbose = args.verbose();
        od::OrderedDictionary merged;

        for (auto const& path : args.getInputs()) {
            std::string content = readFile(path);
            od::OrderedDictionary doc;
            try {
                doc = od::OrderedDictionary::fromJson(content);
            } catch (const od::JsonParseError& e) {
                std::cerr << "JSON parse error in " << path << ": " << e.what() << "\n";
                return 1;
            }
            if (verbose)
                std::cerr << "merging " << path << " (" << doc.count() << " keys, "
                          << (args.recursive() ? "recursive" : "shallow") << ")\n";
            merged.mergeWith(doc, args.recursive());
        }

        std::string text = merged.toJson(args.getIndent());
        if (verbose) std::cerr << "result has " << merged.count() << " keys\n";

        if (args.hasOutput()) {
            std::ofstream out(args.getOutput());
            if (!out) throw IoError("cannot open output: " + args.getOutput());
            out << text << "\n";
            if (verbose) std::cerr << "wrote " << args.getOutput() << "\n";
        } else {
            std::cout << text << "\n";
        }
        return 0;

    } catch (const od::TypeError& e) {
        // a document whose top level is not an object or array
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << od::cli::CliArgs::usage();
        return 2;
    } catch (const IoError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
