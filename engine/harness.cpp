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

#include "engine/harness.hpp"

#include <nlohmann/json.hpp>

#include "model/json.hpp"
#include "model/program.hpp"
#include "utils/format/macros.hpp"
#include "utils/fs/path.hpp"
#include "utils/logging/macros.hpp"
#include "utils/sanity.hpp"
#include "utils/stream.hpp"

namespace fs = utils::fs;
namespace json = nlohmann;
namespace process = utils::process;


namespace {


/// Placeholder in the script templates for the name of the entry point.
static const char* const entry_point_placeholder = "@ENTRY_POINT@";


/// Definitions that route the output of the Python scripts.
///
/// File descriptors 1 and 2 point to the null device from the moment the
/// script starts; the payload goes to a private duplicate of the original
/// standard output.
static const char* const python_channel =
    "import asyncio\n"
    "import contextlib\n"
    "import inspect\n"
    "import io\n"
    "import json\n"
    "import math\n"
    "import os\n"
    "import subprocess\n"
    "import sys\n"
    "import time\n"
    "import traceback\n"
    "\n"
    "START_MARKER = \"__RESULTS_JSON_START__\"\n"
    "END_MARKER = \"__RESULTS_JSON_END__\"\n"
    "RESULTS_FD = os.dup(1)\n"
    "SINK_FD = os.open(os.devnull, os.O_WRONLY)\n"
    "os.dup2(SINK_FD, 1)\n"
    "os.dup2(SINK_FD, 2)\n"
    "\n"
    "\n"
    "def describe(error):\n"
    "    return str(error) or type(error).__name__\n"
    "\n"
    "\n"
    "def emit(payload, status):\n"
    "    text = json.dumps(payload).replace(\"__RESULTS_JSON_\",\n"
    "                                       \"\\\\u005f_RESULTS_JSON_\")\n"
    "    data = (START_MARKER + \"\\n\" + text + \"\\n\" + END_MARKER + \"\\n\").encode()\n"
    "    while data:\n"
    "        data = data[os.write(RESULTS_FD, data):]\n"
    "    os._exit(status)\n";


/// Definitions shared by the Python scripts that invoke an entry point.
static const char* const python_prelude =
    "\n"
    "ENTRY_POINT = @ENTRY_POINT@\n"
    "TOLERANCE = 1e-06\n"
    "\n"
    "\n"
    "def sanitize(value):\n"
    "    if value is None or isinstance(value, (bool, int, str)):\n"
    "        return value\n"
    "    if isinstance(value, float):\n"
    "        return value if math.isfinite(value) else repr(value)\n"
    "    if isinstance(value, dict):\n"
    "        return {str(key): sanitize(item) for key, item in value.items()}\n"
    "    if isinstance(value, (list, tuple, set, frozenset)):\n"
    "        return [sanitize(item) for item in value]\n"
    "    return repr(value)\n"
    "\n"
    "\n"
    "@contextlib.contextmanager\n"
    "def captured(stdout, stderr):\n"
    "    with contextlib.redirect_stdout(stdout), contextlib.redirect_stderr(stderr):\n"
    "        yield\n"
    "\n"
    "\n"
    "def load(source):\n"
    "    namespace = {\"__name__\": \"candidate\"}\n"
    "    with captured(io.StringIO(), io.StringIO()):\n"
    "        exec(compile(source, \"code.py\", \"exec\"), namespace)\n"
    "    return namespace\n"
    "\n"
    "\n"
    "def required_positional(function):\n"
    "    try:\n"
    "        parameters = inspect.signature(function).parameters.values()\n"
    "    except (TypeError, ValueError):\n"
    "        return 1\n"
    "    kinds = (inspect.Parameter.POSITIONAL_ONLY,\n"
    "             inspect.Parameter.POSITIONAL_OR_KEYWORD)\n"
    "    return sum(1 for parameter in parameters\n"
    "               if parameter.kind in kinds\n"
    "               and parameter.default is inspect.Parameter.empty)\n"
    "\n"
    "\n"
    "def accepts_keywords(function, keys):\n"
    "    try:\n"
    "        parameters = inspect.signature(function).parameters\n"
    "    except (TypeError, ValueError):\n"
    "        return True\n"
    "    for parameter in parameters.values():\n"
    "        if parameter.kind == inspect.Parameter.VAR_KEYWORD:\n"
    "            return True\n"
    "    return all(isinstance(key, str) and key in parameters\n"
    "               and parameters[key].kind != inspect.Parameter.POSITIONAL_ONLY\n"
    "               for key in keys)\n"
    "\n"
    "\n"
    "def invoke(function, value, arity):\n"
    "    if isinstance(value, dict) and accepts_keywords(function, value):\n"
    "        output = function(**value)\n"
    "    elif isinstance(value, list) and arity > 1 and len(value) == arity:\n"
    "        output = function(*value)\n"
    "    else:\n"
    "        output = function(value)\n"
    "    if inspect.iscoroutine(output):\n"
    "        output = asyncio.run(output)\n"
    "    return sanitize(output)\n";


/// Body of the Python script that runs all the test cases.
static const char* const python_runner_body =
    "\n"
    "\n"
    "def category(value):\n"
    "    if value is None:\n"
    "        return \"null\"\n"
    "    if isinstance(value, bool):\n"
    "        return \"boolean\"\n"
    "    if isinstance(value, (int, float)):\n"
    "        return \"number\"\n"
    "    if isinstance(value, str):\n"
    "        return \"string\"\n"
    "    if isinstance(value, list):\n"
    "        return \"array\"\n"
    "    if isinstance(value, dict):\n"
    "        return \"object\"\n"
    "    return \"other\"\n"
    "\n"
    "\n"
    "def equal(actual, expected):\n"
    "    kind = category(actual)\n"
    "    if kind != category(expected):\n"
    "        return False\n"
    "    if kind == \"number\":\n"
    "        if isinstance(actual, float) or isinstance(expected, float):\n"
    "            return abs(actual - expected) < TOLERANCE\n"
    "        return actual == expected\n"
    "    if kind == \"array\":\n"
    "        return len(actual) == len(expected) and all(\n"
    "            equal(a, e) for a, e in zip(actual, expected))\n"
    "    if kind == \"object\":\n"
    "        return set(actual) == set(expected) and all(\n"
    "            equal(actual[key], expected[key]) for key in actual)\n"
    "    return actual == expected\n"
    "\n"
    "\n"
    "def run_test(function, arity, index, test_case):\n"
    "    value = test_case.get(\"input\")\n"
    "    expected = test_case.get(\"expected_output\")\n"
    "    result = {\n"
    "        \"test_case_id\": index + 1,\n"
    "        \"input\": value,\n"
    "        \"expected_output\": expected,\n"
    "        \"is_hidden\": bool(test_case.get(\"is_hidden\", False)),\n"
    "        \"explanation\": test_case.get(\"explanation\") or \"\",\n"
    "        \"passed\": False,\n"
    "        \"execution_time\": 0,\n"
    "        \"output\": None,\n"
    "        \"error\": None,\n"
    "    }\n"
    "    stdout = io.StringIO()\n"
    "    stderr = io.StringIO()\n"
    "    start = time.perf_counter()\n"
    "    try:\n"
    "        with captured(stdout, stderr):\n"
    "            output = invoke(function, value, arity)\n"
    "        result[\"output\"] = output\n"
    "        result[\"passed\"] = equal(output, expected)\n"
    "    except BaseException as error:\n"
    "        result[\"error\"] = describe(error)\n"
    "        result[\"traceback\"] = traceback.format_exc()\n"
    "    result[\"execution_time\"] = time.perf_counter() - start\n"
    "    result[\"stdout\"] = stdout.getvalue()\n"
    "    result[\"stderr\"] = stderr.getvalue()\n"
    "    return result\n"
    "\n"
    "\n"
    "def main():\n"
    "    with open(\"code.py\") as f:\n"
    "        source = f.read()\n"
    "    with open(\"test_cases.json\") as f:\n"
    "        test_cases = json.load(f)\n"
    "\n"
    "    try:\n"
    "        namespace = load(source)\n"
    "    except BaseException as error:\n"
    "        emit({\"status\": \"error\", \"error_message\": describe(error),\n"
    "              \"traceback\": traceback.format_exc()}, 1)\n"
    "\n"
    "    function = namespace.get(ENTRY_POINT)\n"
    "    if not callable(function):\n"
    "        emit({\"status\": \"error\",\n"
    "              \"error_message\": \"Function '%s' not found in code\" % ENTRY_POINT}, 1)\n"
    "\n"
    "    arity = required_positional(function)\n"
    "    results = {\"status\": \"success\", \"passed\": 0, \"failed\": 0, \"error\": False,\n"
    "               \"execution_time\": 0, \"test_results\": []}\n"
    "    for index, test_case in enumerate(test_cases):\n"
    "        result = run_test(function, arity, index, test_case)\n"
    "        results[\"passed\" if result[\"passed\"] else \"failed\"] += 1\n"
    "        results[\"test_results\"].append(result)\n"
    "\n"
    "    count = len(test_cases)\n"
    "    times = [result[\"execution_time\"] for result in results[\"test_results\"]]\n"
    "    results[\"execution_time\"] = sum(times)\n"
    "    results[\"all_passed\"] = results[\"failed\"] == 0\n"
    "    results[\"detailed_metrics\"] = {\n"
    "        \"avg_execution_time\": sum(times) / count if count else 0,\n"
    "        \"max_execution_time\": max(times, default=0),\n"
    "        \"success_rate\": results[\"passed\"] / count if count else 0,\n"
    "    }\n"
    "    emit(results, 0)\n"
    "\n"
    "\n"
    "try:\n"
    "    main()\n"
    "except BaseException as error:\n"
    "    emit({\"status\": \"error\", \"error_message\": describe(error),\n"
    "          \"traceback\": traceback.format_exc()}, 1)\n";


/// Body of the Python script that runs a single test input.
static const char* const python_invoker_body =
    "\n"
    "\n"
    "def main():\n"
    "    with open(\"code.py\") as f:\n"
    "        source = f.read()\n"
    "    with open(\"input.json\") as f:\n"
    "        value = json.load(f)\n"
    "\n"
    "    payload = {\"status\": \"error\", \"output\": None, \"stdout\": \"\", \"stderr\": \"\",\n"
    "               \"execution_time\": 0, \"error\": None, \"traceback\": None}\n"
    "    try:\n"
    "        namespace = load(source)\n"
    "    except BaseException as error:\n"
    "        payload[\"error\"] = describe(error)\n"
    "        payload[\"traceback\"] = traceback.format_exc()\n"
    "        emit(payload, 1)\n"
    "\n"
    "    function = namespace.get(ENTRY_POINT)\n"
    "    if not callable(function):\n"
    "        payload[\"error\"] = \"Function '%s' not found in code\" % ENTRY_POINT\n"
    "        emit(payload, 1)\n"
    "\n"
    "    stdout = io.StringIO()\n"
    "    stderr = io.StringIO()\n"
    "    start = time.perf_counter()\n"
    "    try:\n"
    "        with captured(stdout, stderr):\n"
    "            payload[\"output\"] = invoke(function, value,\n"
    "                                       required_positional(function))\n"
    "        payload[\"status\"] = \"success\"\n"
    "    except BaseException as error:\n"
    "        payload[\"error\"] = describe(error)\n"
    "        payload[\"traceback\"] = traceback.format_exc()\n"
    "    payload[\"execution_time\"] = time.perf_counter() - start\n"
    "    payload[\"stdout\"] = stdout.getvalue()\n"
    "    payload[\"stderr\"] = stderr.getvalue()\n"
    "    emit(payload, 0)\n"
    "\n"
    "\n"
    "try:\n"
    "    main()\n"
    "except BaseException as error:\n"
    "    emit({\"status\": \"error\", \"error\": describe(error),\n"
    "          \"traceback\": traceback.format_exc()}, 1)\n";


/// Body of the Python script that runs a program with a given input.
static const char* const python_program_body =
    "\n"
    "\n"
    "def main():\n"
    "    with open(\"input.txt\", \"rb\") as f:\n"
    "        data = f.read()\n"
    "\n"
    "    start = time.perf_counter()\n"
    "    completed = subprocess.run([sys.executable, \"code.py\"], input=data,\n"
    "                               stdout=subprocess.PIPE, stderr=subprocess.PIPE)\n"
    "    emit({\"status\": \"completed\",\n"
    "          \"stdout\": completed.stdout.decode(\"utf-8\", \"replace\"),\n"
    "          \"stderr\": completed.stderr.decode(\"utf-8\", \"replace\"),\n"
    "          \"exit_code\": completed.returncode,\n"
    "          \"execution_time\": time.perf_counter() - start}, 0)\n"
    "\n"
    "\n"
    "try:\n"
    "    main()\n"
    "except BaseException as error:\n"
    "    emit({\"status\": \"error\", \"error_message\": describe(error),\n"
    "          \"traceback\": traceback.format_exc()}, 1)\n";


/// Script that runs all the test cases of a JavaScript program.
///
/// The script re-executes itself as a child whose standard output and error
/// are discarded; the child reports the payload through descriptor 3 and
/// the parent relays it.
static const char* const javascript_runner =
    "'use strict';\n"
    "\n"
    "const childProcess = require('child_process');\n"
    "const fs = require('fs');\n"
    "const util = require('util');\n"
    "const vm = require('vm');\n"
    "\n"
    "const ENTRY_POINT = @ENTRY_POINT@;\n"
    "const START_MARKER = '__RESULTS_JSON_START__';\n"
    "const END_MARKER = '__RESULTS_JSON_END__';\n"
    "const RESULTS_FD = 3;\n"
    "const TOLERANCE = 1e-6;\n"
    "\n"
    "const captured = { stdout: [], stderr: [] };\n"
    "\n"
    "function describe(error) {\n"
    "    if (error !== null && typeof error === 'object' &&\n"
    "        typeof error.message === 'string')\n"
    "        return error.message || String(error.name);\n"
    "    return String(error);\n"
    "}\n"
    "\n"
    "function stackOf(error) {\n"
    "    if (error !== null && typeof error === 'object' && error.stack)\n"
    "        return String(error.stack);\n"
    "    return null;\n"
    "}\n"
    "\n"
    "function frame(payload) {\n"
    "    const text = JSON.stringify(payload).split('__RESULTS_JSON_')\n"
    "        .join('\\\\u005f_RESULTS_JSON_');\n"
    "    return Buffer.from(START_MARKER + '\\n' + text + '\\n' + END_MARKER + '\\n');\n"
    "}\n"
    "\n"
    "function emit(payload, status) {\n"
    "    const data = frame(payload);\n"
    "    let offset = 0;\n"
    "    while (offset < data.length) {\n"
    "        try {\n"
    "            offset += fs.writeSync(RESULTS_FD, data, offset,\n"
    "                                   data.length - offset);\n"
    "        } catch (error) {\n"
    "            if (error.code !== 'EAGAIN')\n"
    "                throw error;\n"
    "        }\n"
    "    }\n"
    "    process.exit(status);\n"
    "}\n"
    "\n"
    "function writer(stream) {\n"
    "    return (...args) => { captured[stream].push(util.format(...args) + '\\n'); };\n"
    "}\n"
    "\n"
    "function sanitize(value) {\n"
    "    if (value === undefined || value === null)\n"
    "        return null;\n"
    "    if (typeof value === 'number')\n"
    "        return Number.isFinite(value) ? value : String(value);\n"
    "    if (typeof value === 'boolean' || typeof value === 'string')\n"
    "        return value;\n"
    "    if (typeof value === 'bigint')\n"
    "        return value.toString();\n"
    "    if (Array.isArray(value))\n"
    "        return value.map(sanitize);\n"
    "    if (value instanceof Map) {\n"
    "        const object = {};\n"
    "        for (const [key, item] of value)\n"
    "            object[String(key)] = sanitize(item);\n"
    "        return object;\n"
    "    }\n"
    "    if (value instanceof Set)\n"
    "        return Array.from(value, sanitize);\n"
    "    if (typeof value === 'object') {\n"
    "        const object = {};\n"
    "        for (const key of Object.keys(value))\n"
    "            object[key] = sanitize(value[key]);\n"
    "        return object;\n"
    "    }\n"
    "    return String(value);\n"
    "}\n"
    "\n"
    "function category(value) {\n"
    "    if (value === null)\n"
    "        return 'null';\n"
    "    if (Array.isArray(value))\n"
    "        return 'array';\n"
    "    const type = typeof value;\n"
    "    if (type === 'boolean' || type === 'number' || type === 'string' ||\n"
    "        type === 'object')\n"
    "        return type;\n"
    "    return 'other';\n"
    "}\n"
    "\n"
    "function equal(actual, expected) {\n"
    "    const kind = category(actual);\n"
    "    if (kind !== category(expected))\n"
    "        return false;\n"
    "    if (kind === 'number') {\n"
    "        if (Number.isInteger(actual) && Number.isInteger(expected))\n"
    "            return actual === expected;\n"
    "        return Math.abs(actual - expected) < TOLERANCE;\n"
    "    }\n"
    "    if (kind === 'array')\n"
    "        return actual.length === expected.length &&\n"
    "            actual.every((item, i) => equal(item, expected[i]));\n"
    "    if (kind === 'object') {\n"
    "        const keys = Object.keys(actual);\n"
    "        return keys.length === Object.keys(expected).length &&\n"
    "            keys.every((key) =>\n"
    "                Object.prototype.hasOwnProperty.call(expected, key) &&\n"
    "                equal(actual[key], expected[key]));\n"
    "    }\n"
    "    return actual === expected;\n"
    "}\n"
    "\n"
    "async function runTest(fn, index, testCase) {\n"
    "    const input = testCase.input === undefined ? null : testCase.input;\n"
    "    const expected = testCase.expected_output === undefined ?\n"
    "        null : testCase.expected_output;\n"
    "    const result = {\n"
    "        test_case_id: index + 1,\n"
    "        input: input,\n"
    "        expected_output: expected,\n"
    "        is_hidden: Boolean(testCase.is_hidden),\n"
    "        explanation: testCase.explanation || '',\n"
    "        passed: false,\n"
    "        execution_time: 0,\n"
    "        output: null,\n"
    "        error: null,\n"
    "    };\n"
    "    captured.stdout = [];\n"
    "    captured.stderr = [];\n"
    "    const start = process.hrtime.bigint();\n"
    "    try {\n"
    "        const args = Array.isArray(input) && fn.length > 1 &&\n"
    "            input.length === fn.length ? input : [input];\n"
    "        let output = fn(...args);\n"
    "        if (output !== null && typeof output === 'object' &&\n"
    "            typeof output.then === 'function')\n"
    "            output = await output;\n"
    "        output = sanitize(output);\n"
    "        result.output = output;\n"
    "        result.passed = equal(output, expected);\n"
    "    } catch (error) {\n"
    "        result.error = describe(error);\n"
    "        result.stack = stackOf(error);\n"
    "    }\n"
    "    result.execution_time = Number(process.hrtime.bigint() - start) / 1e9;\n"
    "    result.stdout = captured.stdout.join('');\n"
    "    result.stderr = captured.stderr.join('');\n"
    "    return result;\n"
    "}\n"
    "\n"
    "async function main() {\n"
    "    const source = fs.readFileSync('code.js', 'utf8');\n"
    "    const testCases = JSON.parse(fs.readFileSync('test_cases.json', 'utf8'));\n"
    "\n"
    "    const sandboxConsole = {\n"
    "        log: writer('stdout'), info: writer('stdout'), debug: writer('stdout'),\n"
    "        error: writer('stderr'), warn: writer('stderr'),\n"
    "    };\n"
    "    const context = vm.createContext({\n"
    "        console: sandboxConsole, module: { exports: {} },\n"
    "        setTimeout, clearTimeout, setInterval, clearInterval,\n"
    "    });\n"
    "    try {\n"
    "        vm.runInContext(source, context, { filename: 'code.js' });\n"
    "    } catch (error) {\n"
    "        return emit({ status: 'error', error_message: describe(error),\n"
    "                      stack: stackOf(error) }, 1);\n"
    "    }\n"
    "\n"
    "    let fn;\n"
    "    try {\n"
    "        fn = vm.runInContext(ENTRY_POINT, context);\n"
    "    } catch (error) {\n"
    "        fn = undefined;\n"
    "    }\n"
    "    if (typeof fn !== 'function')\n"
    "        return emit({ status: 'error',\n"
    "                      error_message: `Function '${ENTRY_POINT}' not found in code` },\n"
    "                    1);\n"
    "\n"
    "    const results = { status: 'success', passed: 0, failed: 0, error: false,\n"
    "                      execution_time: 0, test_results: [] };\n"
    "    for (let i = 0; i < testCases.length; i++) {\n"
    "        const result = await runTest(fn, i, testCases[i]);\n"
    "        results[result.passed ? 'passed' : 'failed']++;\n"
    "        results.test_results.push(result);\n"
    "    }\n"
    "\n"
    "    const count = testCases.length;\n"
    "    const times = results.test_results.map((result) => result.execution_time);\n"
    "    const total = times.reduce((a, b) => a + b, 0);\n"
    "    results.execution_time = total;\n"
    "    results.all_passed = results.failed === 0;\n"
    "    results.detailed_metrics = {\n"
    "        avg_execution_time: count ? total / count : 0,\n"
    "        max_execution_time: count ? Math.max(...times) : 0,\n"
    "        success_rate: count ? results.passed / count : 0,\n"
    "    };\n"
    "    return emit(results, 0);\n"
    "}\n"
    "\n"
    "function supervise() {\n"
    "    const child = childProcess.spawn(process.execPath, [__filename, '--child'], {\n"
    "        stdio: ['ignore', 'ignore', 'ignore', 'pipe'],\n"
    "    });\n"
    "    const chunks = [];\n"
    "    child.stdio[RESULTS_FD].on('data', (chunk) => chunks.push(chunk));\n"
    "    child.on('error', (error) => {\n"
    "        process.stdout.write(frame({ status: 'error',\n"
    "                                     error_message: describe(error) }),\n"
    "                             () => process.exit(1));\n"
    "    });\n"
    "    child.on('close', (code) => {\n"
    "        process.stdout.write(Buffer.concat(chunks),\n"
    "                             () => process.exit(code === null ? 1 : code));\n"
    "    });\n"
    "}\n"
    "\n"
    "if (process.argv[2] === '--child')\n"
    "    main().catch((error) => emit({ status: 'error',\n"
    "                                   error_message: describe(error),\n"
    "                                   stack: stackOf(error) }, 1));\n"
    "else\n"
    "    supervise();\n";


/// Script that runs a JavaScript program with a given input.
static const char* const javascript_program =
    "'use strict';\n"
    "\n"
    "const childProcess = require('child_process');\n"
    "const fs = require('fs');\n"
    "const os = require('os');\n"
    "\n"
    "const START_MARKER = '__RESULTS_JSON_START__';\n"
    "const END_MARKER = '__RESULTS_JSON_END__';\n"
    "const MAX_BUFFER = 64 * 1024 * 1024;\n"
    "\n"
    "function describe(error) {\n"
    "    if (error !== null && typeof error === 'object' &&\n"
    "        typeof error.message === 'string')\n"
    "        return error.message || String(error.name);\n"
    "    return String(error);\n"
    "}\n"
    "\n"
    "function emit(payload, status) {\n"
    "    const text = JSON.stringify(payload).split('__RESULTS_JSON_')\n"
    "        .join('\\\\u005f_RESULTS_JSON_');\n"
    "    process.stdout.write(START_MARKER + '\\n' + text + '\\n' + END_MARKER + '\\n',\n"
    "                         () => process.exit(status));\n"
    "}\n"
    "\n"
    "function main() {\n"
    "    const input = fs.readFileSync('input.txt');\n"
    "\n"
    "    const start = process.hrtime.bigint();\n"
    "    const completed = childProcess.spawnSync(process.execPath, ['code.js'], {\n"
    "        input: input, maxBuffer: MAX_BUFFER,\n"
    "    });\n"
    "    const elapsed = Number(process.hrtime.bigint() - start) / 1e9;\n"
    "    if (completed.error)\n"
    "        return emit({ status: 'error', error_message: describe(completed.error) },\n"
    "                    1);\n"
    "\n"
    "    let exitCode = completed.status;\n"
    "    if (exitCode === null)\n"
    "        exitCode = -(os.constants.signals[completed.signal] || 0);\n"
    "    return emit({\n"
    "        status: 'completed',\n"
    "        stdout: completed.stdout.toString('utf8'),\n"
    "        stderr: completed.stderr.toString('utf8'),\n"
    "        exit_code: exitCode,\n"
    "        execution_time: elapsed,\n"
    "    }, 0);\n"
    "}\n"
    "\n"
    "try {\n"
    "    main();\n"
    "} catch (error) {\n"
    "    emit({ status: 'error', error_message: describe(error) }, 1);\n"
    "}\n";


/// Replaces the entry point placeholder of a script template.
///
/// \param script The script template.
/// \param entry_point The name of the entry point.
///
/// \return The script with the placeholder replaced.
static std::string
substitute_entry_point(const std::string& script,
                       const std::string& entry_point)
{
    const std::string::size_type pos = script.find(entry_point_placeholder);
    INV(pos != std::string::npos);

    std::string result = script;
    result.replace(pos, std::string(entry_point_placeholder).length(),
                   json::json(entry_point).dump());
    return result;
}


}  // anonymous namespace


/// Line printed right before the results payload.
const char* const engine::harness::start_marker = "__RESULTS_JSON_START__";


/// Line printed right after the results payload.
const char* const engine::harness::end_marker = "__RESULTS_JSON_END__";


/// Name of the file that holds the test cases within a workspace.
const char* const engine::harness::test_cases_file = "test_cases.json";


/// Name of the file that holds the single input of the invocation script.
const char* const engine::harness::input_file = "input.json";


/// Name of the single-call invocation script within a workspace.
const char* const engine::harness::invoker_file = "invoke.py";


/// Name of the file that holds the standard input of a program.
const char* const engine::harness::program_input_file = "input.txt";


/// Gets the name of the file that holds the candidate code.
///
/// \param language The language of the code.
///
/// \return A file name relative to the workspace.
const char*
engine::harness::code_file(const model::language language)
{
    switch (language) {
    case model::language_python: return "code.py";
    case model::language_javascript: return "code.js";
    }
    UNREACHABLE;
}


/// Gets the name of the file that holds the harness.
///
/// \param language The language of the harness.
///
/// \return A file name relative to the workspace.
const char*
engine::harness::runner_file(const model::language language)
{
    switch (language) {
    case model::language_python: return "runner.py";
    case model::language_javascript: return "runner.js";
    }
    UNREACHABLE;
}


/// Gets the command that runs the harness within its workspace.
///
/// \param language The language of the harness.
///
/// \return The interpreter followed by its arguments.
process::args_vector
engine::harness::runner_command(const model::language language)
{
    process::args_vector command;
    switch (language) {
    case model::language_python:
        command.push_back("python");
        break;
    case model::language_javascript:
        command.push_back("node");
        break;
    }
    command.push_back(runner_file(language));
    return command;
}


/// Generates the harness for a language.
///
/// \param language The language of the candidate code.
/// \param entry_point The function to invoke.
///
/// \return The source code of the harness.
std::string
engine::harness::runner_script(const model::language language,
                               const std::string& entry_point)
{
    switch (language) {
    case model::language_python:
        return substitute_entry_point(std::string(python_channel) +
                                      python_prelude + python_runner_body,
                                      entry_point);
    case model::language_javascript:
        return substitute_entry_point(javascript_runner, entry_point);
    }
    UNREACHABLE;
}


/// Generates the single-call invocation script for Python code.
///
/// The script reads the input value from input_file, invokes the entry point
/// once and prints its outcome between the markers.  Comparing the output to
/// the expected value is left to the caller.
///
/// \param entry_point The function to invoke.
///
/// \return The source code of the script.
std::string
engine::harness::invoker_script(const std::string& entry_point)
{
    return substitute_entry_point(std::string(python_channel) +
                                  python_prelude + python_invoker_body,
                                  entry_point);
}


/// Generates the script that runs a program with a given standard input.
///
/// The script spawns a separate interpreter on the candidate code, feeds it
/// the contents of program_input_file and prints what the program wrote to
/// its standard output and error, along with its exit code, between the
/// markers.
///
/// \param language The language of the program.
///
/// \return The source code of the script.
std::string
engine::harness::program_script(const model::language language)
{
    switch (language) {
    case model::language_python:
        return std::string(python_channel) + python_program_body;
    case model::language_javascript:
        return javascript_program;
    }
    UNREACHABLE;
}


/// Populates a workspace with the files needed to run a request.
///
/// \param workspace The directory in which to create the files.
/// \param request The request to materialize.
/// \param entry_point The function of the code to test.
///
/// \throw std::runtime_error If any of the files cannot be written.
void
engine::harness::write_workspace(const fs::path& workspace,
                                 const model::execution_request& request,
                                 const std::string& entry_point)
{
    const model::language language = request.language();
    utils::write_file(workspace / code_file(language), request.code());
    utils::write_file(workspace / runner_file(language),
                      runner_script(language, entry_point));
    utils::write_file(workspace / test_cases_file,
                      model::test_cases_to_json(request.test_cases()).dump());
    LD(F("Populated workspace %s for %s request") % workspace % language);
}


/// Populates a workspace with the files needed to run a program.
///
/// \param workspace The directory in which to create the files.
/// \param request The program to materialize.
///
/// \throw std::runtime_error If any of the files cannot be written.
void
engine::harness::write_program_workspace(const fs::path& workspace,
                                         const model::program_request& request)
{
    const model::language language = request.language();
    utils::write_file(workspace / code_file(language), request.code());
    utils::write_file(workspace / runner_file(language),
                      program_script(language));
    utils::write_file(workspace / program_input_file, request.input());
    LD(F("Populated workspace %s for %s program") % workspace % language);
}
