#include "http/ToolCatalog.hpp"

#include <initializer_list>
#include <string>
#include <utility>

namespace llmgate::http {
namespace {

Json::Value stringProperty(const std::string &description) {
    Json::Value property(Json::objectValue);
    property["type"] = "string";
    property["description"] = description;
    return property;
}

Json::Value functionTool(const std::string &name,
                         const std::string &description,
                         Json::Value properties,
                         std::initializer_list<const char *> required) {
    Json::Value parameters(Json::objectValue);
    parameters["type"] = "object";
    parameters["properties"] = std::move(properties);
    Json::Value requiredList(Json::arrayValue);
    for (const auto *field : required) {
        requiredList.append(field);
    }
    parameters["required"] = std::move(requiredList);

    Json::Value function(Json::objectValue);
    function["name"] = name;
    function["description"] = description;
    function["parameters"] = std::move(parameters);

    Json::Value tool(Json::objectValue);
    tool["type"] = "function";
    tool["function"] = std::move(function);
    return tool;
}

Json::Value buildCatalog() {
    Json::Value tools(Json::arrayValue);

    Json::Value webSearch(Json::objectValue);
    webSearch["type"] = "web_search_preview";
    webSearch["description"] = "A tool that enables the model to search the web for up-to-date information";
    tools.append(std::move(webSearch));

    Json::Value calculatorProperties(Json::objectValue);
    calculatorProperties["expression"] =
        stringProperty("The mathematical expression to calculate (e.g., '2+2', 'sin(30)', 'sqrt(144)')");
    tools.append(functionTool("calculate_expression", "Calculate the result of a mathematical expression",
                              std::move(calculatorProperties), {"expression"}));

    Json::Value weatherProperties(Json::objectValue);
    weatherProperties["location"] = stringProperty("The city and state, e.g. San Francisco, CA");
    auto unit = stringProperty("The temperature unit to use. Default is celsius.");
    Json::Value units(Json::arrayValue);
    units.append("celsius");
    units.append("fahrenheit");
    unit["enum"] = std::move(units);
    weatherProperties["unit"] = std::move(unit);
    tools.append(functionTool("get_current_weather", "Get the current weather in a given location",
                              std::move(weatherProperties), {"location"}));

    Json::Value catalog(Json::objectValue);
    catalog["tools"] = std::move(tools);
    catalog["status"] = "success";
    return catalog;
}

}  // namespace

Json::Value toolCatalog() {
    static const Json::Value catalog = buildCatalog();
    return catalog;
}

}  // namespace llmgate::http
