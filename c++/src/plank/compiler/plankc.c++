// Copyright (c) 2013-2014 Sandstorm Development Group, Inc. and contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "codegen.h"
#include "module-loader.h"
#include "pretty-print.h"
#include <kj/main.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/vector.h>
#include <kj/io.h>
#include <unistd.h>

namespace plank {
namespace compiler {

static const char VERSION_STRING[] = "plank schema compiler version 0.3.0";

class CompilerMain final: public GlobalErrorReporter {
public:
  explicit CompilerMain(kj::ProcessContext& context)
      : context(context), disk(kj::newDiskFilesystem()) {}

  kj::MainFunc getMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Compiler for plank schema files: checks them and generates code for them.");
    builder.addSubCommand("compile", KJ_BIND_METHOD(*this, getCompileMain),
                          "Generate source code from schema files.")
           .addSubCommand("format", KJ_BIND_METHOD(*this, getFormatMain),
                          "Print a schema file in standard formatting.");
    addGlobalOptions(builder);
    return builder.build();
  }

  kj::MainFunc getCompileMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Compiles schema files and generates corresponding source code.  Nothing is written "
          "unless every file compiles without errors.");
    addGlobalOptions(builder);
    builder.addOptionWithArg({'o', "output"}, KJ_BIND_METHOD(*this, addOutput), "<lang>[:<dir>]",
                             "Generate code for <lang> in directory <dir> (default: current "
                             "directory).  <lang> is \"c++\" for C++ headers, or \"fbs\" for the "
                             "schema in canonical form.")
           .addOptionWithArg({"src-prefix"}, KJ_BIND_METHOD(*this, setSourcePrefix), "<prefix>",
                             "Source files are named relative to <prefix> (default: current "
                             "directory).  The name decides where output files are written, and "
                             "how generated headers include each other.")
           .expectOneOrMoreArgs("<source>", KJ_BIND_METHOD(*this, addSource))
           .callAfterParsing(KJ_BIND_METHOD(*this, generateOutput));
    return builder.build();
  }

  kj::MainFunc getFormatMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Parses a schema file and prints it back to standard output with standard formatting.  "
          "Comments other than doc comments are not preserved.");
    addGlobalOptions(builder);
    builder.expectArg("<source>", KJ_BIND_METHOD(*this, formatFile));
    return builder.build();
  }

  void addGlobalOptions(kj::MainBuilder& builder) {
    builder.addOptionWithArg({'I', "import-path"}, KJ_BIND_METHOD(*this, addImportPath), "<dir>",
                             "Add <dir> to the list of directories searched for includes that "
                             "can't be found relative to the including file.")
           .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
                      "Log progress information to stderr.");
  }

  // =====================================================================================
  // shared options

  kj::MainBuilder::Validity addImportPath(kj::StringPtr path) {
    KJ_IF_MAYBE(dir, disk->getRoot().tryOpenSubdir(disk->getCurrentPath().evalNative(path))) {
      importPaths.add(&**dir);
      ownedDirs.add(kj::mv(*dir));
      return true;
    } else {
      return "no such directory";
    }
  }

  kj::MainBuilder::Validity setVerbose() {
    kj::_::Debug::setLogLevel(kj::LogSeverity::INFO);
    return true;
  }

  // =====================================================================================
  // "compile" command

  kj::MainBuilder::Validity addOutput(kj::StringPtr spec) {
    kj::StringPtr lang = spec;
    kj::Maybe<kj::StringPtr> dir;
    kj::String langBuffer;
    KJ_IF_MAYBE(split, spec.findFirst(':')) {
      langBuffer = kj::heapString(spec.slice(0, *split));
      lang = langBuffer;
      dir = spec.slice(*split + 1);
    }

    KJ_IF_MAYBE(target, parseTarget(lang)) {
      for (auto& output: outputs) {
        if (output.target == *target) {
          return "language given twice";
        }
      }

      auto path = disk->getCurrentPath().clone();
      KJ_IF_MAYBE(d, dir) {
        path = disk->getCurrentPath().evalNative(*d);
      }
      outputs.add(OutputDirective { *target, kj::mv(path) });
      return true;
    } else {
      return "unknown language; expected \"c++\" or \"fbs\"";
    }
  }

  kj::MainBuilder::Validity setSourcePrefix(kj::StringPtr prefix) {
    if (sources.size() > 0) {
      return "--src-prefix must come before any source file";
    }
    auto path = disk->getCurrentPath().evalNative(prefix);
    KJ_IF_MAYBE(dir, disk->getRoot().tryOpenSubdir(path)) {
      sourceDir = **dir;
      ownedDirs.add(kj::mv(*dir));
      sourcePrefix = kj::mv(path);
      return true;
    } else {
      return "no such directory";
    }
  }

  kj::MainBuilder::Validity addSource(kj::StringPtr file) {
    auto prefix = getSourcePrefix();
    auto path = disk->getCurrentPath().evalNative(file);
    if (!path.startsWith(prefix) || path.size() == prefix.size()) {
      return "file is not inside the source directory; pass --src-prefix";
    }
    sources.add(path.slice(prefix.size(), path.size()).clone());
    return true;
  }

  kj::MainBuilder::Validity generateOutput() {
    if (outputs.size() == 0) {
      return "no outputs specified";
    }

    auto targets = KJ_MAP(output, outputs) { return output.target; };
    auto result = compileAndGenerate(getSourceDir(), sources, importPaths, targets);

    KJ_SWITCH_ONEOF(result) {
      KJ_CASE_ONEOF(diagnostics, kj::Array<Diagnostic>) {
        for (auto& diagnostic: diagnostics) {
          context.error(kj::str(diagnostic));
        }
        context.exitError(kj::str(diagnostics.size(), " error(s); nothing was written"));
      }
      KJ_CASE_ONEOF(files, kj::Array<GeneratedFile>) {
        for (auto& file: files) {
          writeOutput(file);
        }
      }
    }

    return true;
  }

  // =====================================================================================
  // "format" command

  kj::MainBuilder::Validity formatFile(kj::StringPtr file) {
    ModuleLoader loader(*this);
    auto path = disk->getCurrentPath().evalNative(file);
    KJ_IF_MAYBE(module, loader.loadModule(disk->getRoot(), path)) {
      KJ_IF_MAYBE(schema, module->loadContent()) {
        kj::FdOutputStream(STDOUT_FILENO).write(prettyPrint(*schema).asBytes());
        return true;
      } else {
        context.exitError("the file has syntax errors; nothing was printed");
      }
    } else {
      return "no such file";
    }
  }

  // =====================================================================================

  void addError(kj::StringPtr file, SourcePos start, SourcePos end, Error&& error) override {
    context.error(kj::str(Diagnostic { kj::heapString(file), start, end, kj::mv(error) }));
    hadErrors_ = true;
  }

  bool hadErrors() override {
    return hadErrors_;
  }

private:
  kj::ProcessContext& context;
  kj::Own<kj::Filesystem> disk;

  kj::Vector<kj::Own<const kj::ReadableDirectory>> ownedDirs;
  kj::Vector<const kj::ReadableDirectory*> importPaths;
  kj::Maybe<const kj::ReadableDirectory&> sourceDir;
  kj::Maybe<kj::Path> sourcePrefix;
  kj::Vector<kj::Path> sources;

  struct OutputDirective {
    Target target;
    kj::Path dir;
  };
  kj::Vector<OutputDirective> outputs;

  bool hadErrors_ = false;

  kj::PathPtr getSourcePrefix() {
    KJ_IF_MAYBE(p, sourcePrefix) {
      return *p;
    } else {
      return disk->getCurrentPath();
    }
  }

  const kj::ReadableDirectory& getSourceDir() {
    KJ_IF_MAYBE(d, sourceDir) {
      return *d;
    } else {
      return disk->getCurrent();
    }
  }

  void writeOutput(const GeneratedFile& file) {
    for (auto& output: outputs) {
      if (output.target == file.target) {
        auto path = output.dir.eval(file.path);
        KJ_LOG(INFO, "writing", path.toString(true));
        disk->getRoot().openFile(path, kj::WriteMode::CREATE | kj::WriteMode::MODIFY |
                                       kj::WriteMode::CREATE_PARENT)
            ->writeAll(file.content);
        return;
      }
    }
    KJ_FAIL_ASSERT("generated a file for a language that wasn't requested", file.target);
  }
};

}  // namespace compiler
}  // namespace plank

KJ_MAIN(plank::compiler::CompilerMain);
