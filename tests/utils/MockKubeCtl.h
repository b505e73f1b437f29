////////////////////////////////////////////////////////////////////////////////
/// @brief scripted kubectl for tests
///
/// @file
///
/// DISCLAIMER
///
/// Copyright 2015 ArangoDB GmbH, Cologne, Germany
///
/// Licensed under the Apache License, Version 2.0 (the "License");
/// you may not use this file except in compliance with the License.
/// You may obtain a copy of the License at
///
///     http://www.apache.org/licenses/LICENSE-2.0
///
/// Unless required by applicable law or agreed to in writing, software
/// distributed under the License is distributed on an "AS IS" BASIS,
/// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
/// See the License for the specific language governing permissions and
/// limitations under the License.
///
/// Copyright holder is ArangoDB GmbH, Cologne, Germany
///
/// @author Dr. Frank Celler
/// @author Copyright 2015, ArangoDB GmbH, Cologne, Germany
////////////////////////////////////////////////////////////////////////////////

#ifndef DBAAS_TESTS_MOCK_KUBE_CTL_H
#define DBAAS_TESTS_MOCK_KUBE_CTL_H 1

#include "KubeCtl.h"
#include "utils.h"

#include <map>
#include <string>
#include <vector>

#include <gmock/gmock.h>

namespace dbaas {
namespace test {

////////////////////////////////////////////////////////////////////////////////
/// @brief kubectl answering command lines from a script
///
/// Unscripted "get" commands fail with NOT_FOUND, every other unscripted
/// command succeeds with empty output. Documents passed to "apply" and
/// "delete" are recorded.
////////////////////////////////////////////////////////////////////////////////

  class MockKubeCtl : public KubeCtl {
    public:
      MockKubeCtl () {
        ON_CALL(*this, run(::testing::_, ::testing::_, ::testing::_))
          .WillByDefault(::testing::Invoke(this, &MockKubeCtl::answer));
      }

    public:
      MOCK_METHOD3(run, Result (const std::vector<std::string>&,
                                const picojson::value*,
                                std::string&));

    public:
      void respond (const std::string& command, const std::string& output) {
        _outputs[command] = output;
      }

      void fail (const std::string& command,
                 ErrorCode code,
                 const std::string& message) {
        _errors.erase(command);
        _errors.insert(std::make_pair(command, Result::error(code, message)));
      }

      bool called (const std::string& command) const {
        for (const auto& c : commands) {
          if (c == command) {
            return true;
          }
        }

        return false;
      }

    public:
      Result answer (const std::vector<std::string>& args,
                     const picojson::value* input,
                     std::string& output) {
        std::string command = join(args, " ");
        commands.push_back(command);

        if (input != nullptr) {
          if (args[0] == "apply") {
            applied.push_back(*input);
          }
          else if (args[0] == "delete") {
            deleted.push_back(*input);
          }
        }

        auto err = _errors.find(command);

        if (err != _errors.end()) {
          return err->second;
        }

        auto out = _outputs.find(command);

        if (out != _outputs.end()) {
          output = out->second;
          return Result::noError();
        }

        if (args[0] == "get") {
          return Result::notFound("Error from server (NotFound): " + command);
        }

        output = "";
        return Result::noError();
      }

    public:
      std::vector<std::string> commands;
      std::vector<picojson::value> applied;
      std::vector<picojson::value> deleted;

    private:
      std::map<std::string, std::string> _outputs;
      std::map<std::string, Result> _errors;
  };

////////////////////////////////////////////////////////////////////////////////
/// @brief parses json in tests
////////////////////////////////////////////////////////////////////////////////

  inline picojson::value parseJson (const std::string& json) {
    picojson::value result;
    std::string err = picojson::parse(result, json);
    EXPECT_TRUE(err.empty()) << err;
    return result;
  }
}
}

#endif
