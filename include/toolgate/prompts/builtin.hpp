#pragma once
#include "toolgate/prompts/prompt.hpp"

namespace toolgate::prompts
{

Prompt make_coding_assistant_prompt();
Prompt make_data_analyst_prompt();

} // namespace toolgate::prompts
