#include "build/slice_builder.hpp"
#include <memory>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace slicer::build {

SliceBuilder::SliceBuilder(ArchiveWriter writer, BuildCallback& callback, std::string graph_name, bool skip_filename)
  : writer_(std::move(writer))
  , callback_(callback)
  , graph_name_(std::move(graph_name))
  , skip_filename_(skip_filename) {}

void SliceBuilder::build(const partition::SlicePlan& plan) const {
  const std::string name = slice_name(graph_name_, plan.slice_index, plan.slice_total);
  BOOST_LOG_TRIVIAL(info) << "Build: Building " << name << " from " << plan.descriptors.size() << " descriptor(s)";

  std::unique_ptr<SliceArchive> archive;
  try {
    archive = writer_.write(plan.descriptors);
  } catch (const std::exception& e) {
    callback_.on_error(e);
    return;
  }

  const std::string summary = detail(*archive);
  callback_.on_success(*archive, name, archive->content_id(), summary);
  BOOST_LOG_TRIVIAL(info) << "Build: " << name << " done, content id " << archive->content_id();
}

std::string SliceBuilder::slice_name(const std::string& graph_name, std::size_t slice_index, std::size_t slice_total) {
  return graph_name + "-total-" + std::to_string(slice_total) + "-part-" + std::to_string(slice_index + 1);
}

std::string SliceBuilder::detail(const SliceArchive& archive) const {
  nlohmann::json links = nlohmann::json::array();
  for (const auto& entry : archive.entries()) {
    nlohmann::json link;
    if (!skip_filename_) {
      link["Name"] = entry.name;
    }
    link["Hash"] = entry.digest;
    link["Size"] = entry.size;
    links.push_back(std::move(link));
  }

  nlohmann::json root;
  root["Name"] = "";
  root["Hash"] = archive.content_id();
  root["Size"] = archive.size();
  root["Link"] = std::move(links);
  return root.dump();
}

} // namespace slicer::build
