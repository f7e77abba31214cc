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

#include "engine/scheduler.hpp"

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include <atf-c++.hpp>
#include <nlohmann/json.hpp>

#include "engine/exceptions.hpp"
#include "model/test_case.hpp"
#include "utils/format/macros.hpp"
#include "utils/optional.ipp"

namespace json = nlohmann;


namespace {


/// Backend that echoes the code of each request as the error message.
///
/// Keeps track of the number of requests that run at the same time.
class echo_backend : public engine::backend {
    /// Protects the fields below.
    std::mutex _mutex;

    /// Number of requests currently running.
    int _running;

public:
    /// Largest number of requests that ran at the same time.
    int max_running;

    /// Number of calls to cleanup().
    int cleanups;

    /// Constructor.
    echo_backend(void) : _running(0), max_running(0), cleanups(0)
    {
    }

    const char*
    name(void) const
    {
        return "echo";
    }

    bool
    supports(const model::language /* language */) const
    {
        return true;
    }

    model::execution_result
    execute(const model::execution_request& request)
    {
        {
            std::lock_guard< std::mutex > lock(_mutex);
            _running++;
            if (_running > max_running)
                max_running = _running;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        {
            std::lock_guard< std::mutex > lock(_mutex);
            _running--;
        }
        return model::execution_result::make_error(model::fault_protocol,
                                                   request.code());
    }

    model::program_result
    run_program(const model::program_request& request)
    {
        return model::program_result::make_error(model::fault_protocol,
                                                 request.code());
    }

    void
    cleanup(void)
    {
        std::lock_guard< std::mutex > lock(_mutex);
        cleanups++;
    }
};


/// Constructs a JavaScript request, which skips the pre-screener.
///
/// \param code The code of the request.
///
/// \return A new request.
static model::execution_request
make_request(const std::string& code)
{
    model::test_cases_vector test_cases;
    test_cases.push_back(model::test_case(json::json::array({1}), 1));
    return model::execution_request(model::language_javascript, code,
                                    test_cases);
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(submit__results_in_order);
ATF_TEST_CASE_BODY(submit__results_in_order)
{
    std::shared_ptr< echo_backend > backend(new echo_backend());
    engine::scheduler scheduler(engine::evaluator(backend, true), 3);

    std::vector< std::future< model::execution_result > > results;
    for (int i = 0; i < 6; ++i)
        results.push_back(scheduler.submit(make_request(F("code %s") % i)));

    for (int i = 0; i < 6; ++i) {
        const model::execution_result result = results[i].get();
        ATF_REQUIRE_EQ(std::string(F("code %s") % i), result.message().get());
        ATF_REQUIRE_EQ("echo", result.backend());
    }
    scheduler.cleanup();
}


ATF_TEST_CASE_WITHOUT_HEAD(submit__concurrent);
ATF_TEST_CASE_BODY(submit__concurrent)
{
    std::shared_ptr< echo_backend > backend(new echo_backend());
    engine::scheduler scheduler(engine::evaluator(backend, true), 3);

    std::vector< std::future< model::execution_result > > results;
    for (int i = 0; i < 6; ++i)
        results.push_back(scheduler.submit(make_request("code")));
    for (std::vector< std::future< model::execution_result > >::iterator
             iter = results.begin(); iter != results.end(); ++iter)
        (void)(*iter).get();
    scheduler.cleanup();

    ATF_REQUIRE(backend->max_running > 1);
    ATF_REQUIRE(backend->max_running <= 3);
}


ATF_TEST_CASE_WITHOUT_HEAD(submit__serial);
ATF_TEST_CASE_BODY(submit__serial)
{
    std::shared_ptr< echo_backend > backend(new echo_backend());
    engine::scheduler scheduler(engine::evaluator(backend, true), 1);

    std::vector< std::future< model::execution_result > > results;
    for (int i = 0; i < 3; ++i)
        results.push_back(scheduler.submit(make_request("code")));
    scheduler.cleanup();

    for (std::vector< std::future< model::execution_result > >::iterator
             iter = results.begin(); iter != results.end(); ++iter)
        ATF_REQUIRE_EQ("code", (*iter).get().message().get());
    ATF_REQUIRE_EQ(1, backend->max_running);
}


ATF_TEST_CASE_WITHOUT_HEAD(cleanup__waits_and_releases);
ATF_TEST_CASE_BODY(cleanup__waits_and_releases)
{
    std::shared_ptr< echo_backend > backend(new echo_backend());
    engine::scheduler scheduler(engine::evaluator(backend, true), 2);

    std::future< model::execution_result > result = scheduler.submit(
        make_request("pending"));
    scheduler.cleanup();
    ATF_REQUIRE(result.wait_for(std::chrono::seconds(0)) ==
                std::future_status::ready);
    ATF_REQUIRE_EQ("pending", result.get().message().get());
    ATF_REQUIRE_EQ(1, backend->cleanups);
}


ATF_TEST_CASE_WITHOUT_HEAD(submit__after_cleanup);
ATF_TEST_CASE_BODY(submit__after_cleanup)
{
    std::shared_ptr< echo_backend > backend(new echo_backend());
    engine::scheduler scheduler(engine::evaluator(backend, true), 2);
    scheduler.cleanup();

    ATF_REQUIRE_THROW_RE(engine::error, "after cleanup",
                         scheduler.submit(make_request("late")));
}


ATF_TEST_CASE_WITHOUT_HEAD(destructor__no_cleanup);
ATF_TEST_CASE_BODY(destructor__no_cleanup)
{
    std::shared_ptr< echo_backend > backend(new echo_backend());
    std::future< model::execution_result > result;
    {
        engine::scheduler scheduler(engine::evaluator(backend, true), 2);
        result = scheduler.submit(make_request("pending"));
    }
    ATF_REQUIRE_EQ("pending", result.get().message().get());
    ATF_REQUIRE_EQ(0, backend->cleanups);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, submit__results_in_order);
    ATF_ADD_TEST_CASE(tcs, submit__concurrent);
    ATF_ADD_TEST_CASE(tcs, submit__serial);
    ATF_ADD_TEST_CASE(tcs, cleanup__waits_and_releases);
    ATF_ADD_TEST_CASE(tcs, submit__after_cleanup);
    ATF_ADD_TEST_CASE(tcs, destructor__no_cleanup);
}
