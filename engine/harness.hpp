// Copyright 2012 Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// * Redistributions of source code must retain the above copyright
//   notice, this list of conditions and the following disclaimer.
// * Redistributions in binary form must reproduce the above copyright
//   notice, this list of conditions and the following disclaimer in the
//   documentation and/or other materials provided with the distribution.
// * Neither the name of Google Inc. nor the names of its contributors
//   may be used to endorse or promote products derived from this software
//   without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/// \file engine/harness.hpp
/// Synthesis of the programs that run candidate code against test cases.
///
/// A harness is a standalone program in the language of the candidate code.
/// It loads the candidate code from a file into a namespace of its own,
/// invokes the entry point once per test case while capturing any output,
/// compares the returned values to the expected ones and prints a JSON
/// payload with the results between two marker lines.  Occurrences of the
/// marker prefix within the payload are escaped so that output produced by
/// the candidate code cannot terminate the payload early.  The payload is
/// written through a channel that the candidate code does not reach through
/// its standard output or error, so printing a fake payload has no effect.
///
/// Programs that read their standard input get a different script: it runs
/// the candidate code in a child interpreter and reports what the child
/// printed.

#if !defined(ENGINE_HARNESS_HPP)
#define ENGINE_HARNESS_HPP

#include <string>

#include "model/execution_request.hpp"
#include "model/language.hpp"
#include "model/program.hpp"
#include "utils/fs/path.hpp"
#include "utils/process/operations.hpp"

namespace engine {
namespace harness {


extern const char* const start_marker;
extern const char* const end_marker;

extern const char* const test_cases_file;
extern const char* const input_file;
extern const char* const invoker_file;
extern const char* const program_input_file;


const char* code_file(const model::language);
const char* runner_file(const model::language);
utils::process::args_vector runner_command(const model::language);

std::string runner_script(const model::language, const std::string&);
std::string invoker_script(const std::string&);
std::string program_script(const model::language);

void write_workspace(const utils::fs::path&, const model::execution_request&,
                     const std::string&);
void write_program_workspace(const utils::fs::path&,
                             const model::program_request&);


}  // namespace harness
}  // namespace engine

#endif  // !defined(ENGINE_HARNESS_HPP)
