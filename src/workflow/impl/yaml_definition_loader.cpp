#include <workflow/exceptions.hpp>
#include <workflow/impl/yaml_definition_loader.hpp>
#include <workflow/yaml_conversion.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <exception>

namespace impl {

Workflow YamlDefinitionLoader::load(std::filesystem::path const &path) const {
    if(not std::filesystem::exists(path))
        throw WorkflowDefinitionException{ path.string(), "file does not exist" };
    if(not std::filesystem::is_regular_file(path))
        throw WorkflowDefinitionException{ path.string(), "not a regular file" };

    try {
        YAML::Node doc = YAML::LoadFile(path.string());
        return doc.as<Workflow>();
    } catch(YAML::Exception const &e) {
        throw WorkflowDefinitionException{ path.string(), e.what() };
    } catch(std::exception const &e) {
        throw WorkflowDefinitionException{ path.string(), e.what() };
    }
}

std::vector<std::filesystem::path> YamlDefinitionLoader::discover(std::filesystem::path const &dir) const {
    std::vector<std::filesystem::path> found;
    if(not std::filesystem::is_directory(dir))
        return found;

    for(auto const &entry : std::filesystem::directory_iterator{ dir }) {
        if(not entry.is_regular_file())
            continue;

        auto const ext = entry.path().extension();
        if(ext == ".json" or ext == ".yaml" or ext == ".yml")
            found.push_back(entry.path());
    }

    std::sort(std::begin(found), std::end(found));
    return found;
}

} // namespace impl
