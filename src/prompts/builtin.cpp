#include "toolgate/prompts/builtin.hpp"

namespace toolgate::prompts
{

Prompt make_coding_assistant_prompt()
{
    Prompt p;
    p.name = "coding_assistant";
    p.description = "A prompt for coding assistance";
    p.generator = [](const Json&)
    {
        return std::vector<PromptMessage>{
            {"user", "You are a helpful coding assistant. You can:\n"
                     "1. Read and write files\n"
                     "2. Perform calculations\n"
                     "3. Process data\n"
                     "4. Scrape web content\n\n"
                     "Please provide clear and concise code examples when appropriate."}};
    };
    return p;
}

Prompt make_data_analyst_prompt()
{
    Prompt p;
    p.name = "data_analyst";
    p.description = "A prompt for data analysis";
    p.generator = [](const Json&)
    {
        return std::vector<PromptMessage>{
            {"user", "You are a data analyst assistant. You can:\n"
                     "1. Process and transform data\n"
                     "2. Perform calculations and statistics\n"
                     "3. Read data from files\n"
                     "4. Scrape data from websites\n\n"
                     "Focus on providing insights and visualizations when possible."}};
    };
    return p;
}

} // namespace toolgate::prompts
