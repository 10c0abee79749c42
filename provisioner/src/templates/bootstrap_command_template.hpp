#pragma once

#include <cstddef>
#include <string>

namespace templates {

// specialize pass: re-reads the answer file Windows Setup cached on disk,
// pulls the embedded CopyScript out of the extension namespace and runs it
// with the deployment folder name as its only argument.
// Kept terse, Setup rejects a RunSynchronousCommand Path over 259 characters.
const std::string SPECIALIZE_BOOTSTRAP_TEMPLATE =
    R"(powershell -NoP -EP Bypass -C "$x=[xml](gc '{{ANSWER_FILE}}' -Raw);)"
    R"(&([ScriptBlock]::Create($x.GetElementsByTagName('CopyScript','{{EXTENSION_NAMESPACE}}')[0].InnerText)))"
    R"( '{{DEPLOYMENT_FOLDER}}'")";

const std::string SPECIALIZE_BOOTSTRAP_DESCRIPTION =
    "Extract and run the embedded {{DEPLOYMENT_FOLDER}} copy script";

// oobeSystem pass: second stage, copied to disk by the specialize script.
const std::string FIRST_LOGON_TEMPLATE =
    R"(powershell.exe -NoProfile -ExecutionPolicy Bypass -File "{{SECOND_STAGE_SCRIPT}}")";

const std::string FIRST_LOGON_DESCRIPTION = "Run the {{DEPLOYMENT_FOLDER}} second stage";

constexpr size_t MAX_COMMAND_PATH_LENGTH = 259;

} // namespace templates
