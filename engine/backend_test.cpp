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

#include "engine/backend.hpp"

#include <atf-c++.hpp>

#include "engine/exceptions.hpp"
#include "utils/optional.ipp"

namespace datetime = utils::datetime;


namespace {


/// Container runtime that only answers version queries.
class counting_runtime : public engine::container_runtime {
    /// Whether the runtime answers the version queries.
    bool _available;

public:
    /// Number of version queries received.
    int queries;

    /// Constructor.
    ///
    /// \param available_ Whether the runtime answers the version queries.
    explicit counting_runtime(const bool available_) :
        _available(available_), queries(0)
    {
    }

    std::string
    version(void)
    {
        queries++;
        if (!_available)
            throw engine::container_error("Cannot connect to the daemon");
        return "24.0.5";
    }

    void
    create(const engine::container_spec& /* spec */)
    {
        ATF_FAIL("Unexpected call to create");
    }

    void
    start(const std::string& /* name */)
    {
        ATF_FAIL("Unexpected call to start");
    }

    utils::optional< int >
    wait(const std::string& /* name */, const datetime::delta& /* timeout */)
    {
        ATF_FAIL("Unexpected call to wait");
    }

    void
    stop(const std::string& /* name */)
    {
        ATF_FAIL("Unexpected call to stop");
    }

    std::string
    logs(const std::string& /* name */)
    {
        ATF_FAIL("Unexpected call to logs");
    }

    void
    remove(const std::string& /* name */)
    {
        ATF_FAIL("Unexpected call to remove");
    }
};


/// Constructs a configuration that selects a given backend.
///
/// \param mode The backend selection strategy.
///
/// \return The configuration.
static engine::config
config_for(const engine::backend_mode mode)
{
    engine::config settings;
    settings.backend = mode;
    return settings;
}


}  // anonymous namespace


ATF_TEST_CASE_WITHOUT_HEAD(setup_backend__container);
ATF_TEST_CASE_BODY(setup_backend__container)
{
    std::shared_ptr< counting_runtime > runtime(new counting_runtime(true));
    const std::shared_ptr< engine::backend > backend = engine::setup_backend(
        config_for(engine::backend_container), runtime);
    ATF_REQUIRE_EQ(std::string("container"), backend->name());
    ATF_REQUIRE_EQ(1, runtime->queries);
}


ATF_TEST_CASE_WITHOUT_HEAD(setup_backend__container_unavailable);
ATF_TEST_CASE_BODY(setup_backend__container_unavailable)
{
    std::shared_ptr< counting_runtime > runtime(new counting_runtime(false));
    ATF_REQUIRE_THROW_RE(engine::error, "Container backend unavailable: "
                         "Cannot connect to the daemon",
                         engine::setup_backend(
                             config_for(engine::backend_container), runtime));
}


ATF_TEST_CASE_WITHOUT_HEAD(setup_backend__host);
ATF_TEST_CASE_BODY(setup_backend__host)
{
    std::shared_ptr< counting_runtime > runtime(new counting_runtime(true));
    const std::shared_ptr< engine::backend > backend = engine::setup_backend(
        config_for(engine::backend_host), runtime);
    ATF_REQUIRE_EQ(std::string("host"), backend->name());
    ATF_REQUIRE_EQ(0, runtime->queries);
}


ATF_TEST_CASE_WITHOUT_HEAD(setup_backend__auto_available);
ATF_TEST_CASE_BODY(setup_backend__auto_available)
{
    std::shared_ptr< counting_runtime > runtime(new counting_runtime(true));
    const std::shared_ptr< engine::backend > backend = engine::setup_backend(
        config_for(engine::backend_auto), runtime);
    ATF_REQUIRE_EQ(std::string("container"), backend->name());
    ATF_REQUIRE_EQ(1, runtime->queries);
}


ATF_TEST_CASE_WITHOUT_HEAD(setup_backend__auto_fallback);
ATF_TEST_CASE_BODY(setup_backend__auto_fallback)
{
    std::shared_ptr< counting_runtime > runtime(new counting_runtime(false));
    const std::shared_ptr< engine::backend > backend = engine::setup_backend(
        config_for(engine::backend_auto), runtime);
    ATF_REQUIRE_EQ(std::string("host"), backend->name());
    ATF_REQUIRE_EQ(1, runtime->queries);
}


ATF_INIT_TEST_CASES(tcs)
{
    ATF_ADD_TEST_CASE(tcs, setup_backend__container);
    ATF_ADD_TEST_CASE(tcs, setup_backend__container_unavailable);
    ATF_ADD_TEST_CASE(tcs, setup_backend__host);
    ATF_ADD_TEST_CASE(tcs, setup_backend__auto_available);
    ATF_ADD_TEST_CASE(tcs, setup_backend__auto_fallback);
}
