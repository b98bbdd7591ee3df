#include "mm/fix/fix_options.hpp"

#include <string>

namespace mm::fix
{

void registerFixOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionEnabled, config::OptionKind::Boolean, config::OptionValue(true),
                             "Repair Enabled",
                             "When disabled, diagrams are passed through without any rewriting."});
    registry.registerOption({kOptionExtraNodeTriggers, config::OptionKind::Characters,
                             config::OptionValue(std::string()), "Extra Node Label Triggers",
                             "Characters that force a node label to be quoted in addition to . ! : & | ( )."});
    registry.registerOption({kOptionExtraEdgeTriggers, config::OptionKind::Characters,
                             config::OptionValue(std::string()), "Extra Edge Label Triggers",
                             "Characters that force an edge label to be quoted in addition to . ! : & | ( ) { }."});
    registry.registerOption({kOptionReportFormat, config::OptionKind::String, config::OptionValue("text"),
                             "Report Format", "Format used by --report: text or json.", {"text", "json"}});
}

repair::SanitizerOptions sanitizerOptionsFrom(const config::OptionRegistry &registry)
{
    repair::SanitizerOptions options;
    options.enabled = registry.getBool(kOptionEnabled, true);
    options.extraNodeTriggers = registry.getString(kOptionExtraNodeTriggers);
    options.extraEdgeTriggers = registry.getString(kOptionExtraEdgeTriggers);
    return options;
}

} // namespace mm::fix
