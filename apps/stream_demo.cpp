#include "aikit/client.hpp"
#include "aikit/utils/env.hpp"

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace {

nlohmann::json make_request(const std::string& model,
                            const std::string& text,
                            const std::optional<std::string>& previous_response_id)
{
  nlohmann::json body = {
      {"model", model},
      {"instructions", "You are a helpful assistant speaking to a user from a C++ demo app."},
      {"input", nlohmann::json::array({{{"role", "user"}, {"content", text}}})}};
  if (previous_response_id)
  {
    body["previous_response_id"] = *previous_response_id;
  }
  return body;
}

}  // namespace

int main()
{
  try
  {
    aikit::ClientOptions options;
    options.log_level = aikit::parse_log_level(aikit::utils::read_env_or("AIKIT_DEMO_LOG", "off"));
    options.logger = [](aikit::LogLevel level, const std::string& message, const nlohmann::json& details)
    {
      std::cerr << "\n[" << aikit::to_string(level) << "] " << message << " " << details.dump() << std::endl;
    };

    aikit::Client client(options);
    const std::string model = aikit::utils::read_env_or("AIKIT_DEMO_MODEL", "gpt-4o-mini");

    std::cout << "Interactive streaming chat demo\n"
              << "Type 'exit' or 'quit' to stop.\n";

    std::optional<std::string> previous_response_id;

    for (;;)
    {
      std::cout << "\nYou> " << std::flush;
      std::string user_input;

      if (!std::getline(std::cin, user_input))
      {
        std::cout << "\nEnd of input, exiting.\n";
        break;
      }

      if (user_input == "exit" || user_input == "quit")
      {
        std::cout << "Goodbye!\n";
        break;
      }

      if (user_input.empty())
      {
        continue;
      }

      aikit::CallOptions call;
      call.callbacks.on_retry = [](const aikit::RetryEvent& event)
      {
        std::cerr << "\n[retrying in " << event.delay.count() << " ms: " << event.error.title << "]" << std::endl;
      };

      std::cout << "Assistant> " << std::flush;

      try
      {
        auto stream = client.responses_stream(make_request(model, user_input, previous_response_id), call);
        std::size_t printed = 0;
        for (const auto& snapshot : stream)
        {
          const std::string text = snapshot.output_text();
          if (text.size() > printed)
          {
            std::cout << text.substr(printed) << std::flush;
            printed = text.size();
          }
        }

        const aikit::AccumulatedResult& result = stream.current();
        if (printed == 0)
        {
          std::cout << "[No text returned]";
        }
        std::cout << std::endl;

        for (const auto& item : result.items)
        {
          if (item.type == aikit::ItemType::ToolCall)
          {
            std::cout << "(tool call " << item.name.value_or("?") << " " << item.arguments << ")" << std::endl;
          }
        }
        if (result.usage)
        {
          std::cout << "(" << result.usage->input_tokens << " in / " << result.usage->output_tokens
                    << " out tokens)" << std::endl;
        }
        previous_response_id = result.id;
      }
      catch (const aikit::RequestError& error)
      {
        const aikit::ClassifiedError& classified = error.classified();
        std::cerr << "\n" << classified.title << ": " << classified.message << std::endl;
        std::cerr << "  " << error.what() << std::endl;
        for (const auto& action : classified.actions)
        {
          std::cerr << "  - " << action.description() << std::endl;
        }
      }
      catch (const aikit::ProtocolViolationError& error)
      {
        std::cerr << "\nStream error: " << error.what() << std::endl;
      }
    }
  }
  catch (const aikit::Error& error)
  {
    std::cerr << "aikit error: " << error.what() << std::endl;
    return 1;
  }
  catch (const std::exception& error)
  {
    std::cerr << "Unexpected error: " << error.what() << std::endl;
    return 1;
  }

  return 0;
}
