// Unit coverage for deriving markup/layout facts from image paths.
#include <iostream>
#include <string>

#include "core/path_resolver.h"

using namespace tilecut::core;
namespace fs = std::filesystem;

namespace {

bool check(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "[path_resolver_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool resolve(const std::string& path, PathSemantics& out) {
    Error error;
    if (!resolve_path_semantics(path, out, error)) {
        std::cerr << "[path_resolver_unit] unexpected failure for " << path << ": " << error.message << "\n";
        return false;
    }
    return true;
}

bool test_wrapper_before_pc() {
    PathSemantics s;
    bool ok = check(resolve("/srv/site/images/widget/pc/hero/banner.png", s), "resolves widget/pc path");
    ok &= check(s.wrapper_class == std::optional<std::string>("widget"), "class taken right after images");
    ok &= check(s.is_responsive, "pc segment makes it responsive");
    ok &= check(s.sub_directory == "hero", "sub directory after pc");
    ok &= check(s.output_extension == OutputExtension::png, "png stays png");
    ok &= check(s.relative_base_path == "./images/widget", "base runs from images up to pc");
    ok &= check(!s.is_first_view, "no fv segment");
    return ok;
}

bool test_wrapper_after_pc() {
    PathSemantics s;
    bool ok = check(resolve("site/images/pc/hero/banner.jpg", s), "resolves images/pc path");
    ok &= check(s.wrapper_class == std::optional<std::string>("hero"), "class taken after pc");
    ok &= check(s.is_responsive, "responsive");
    ok &= check(s.relative_base_path == "./images", "base is images itself");
    ok &= check(s.sub_directory == "hero", "sub directory");
    ok &= check(s.output_extension == OutputExtension::jpg, "jpg output");
    return ok;
}

bool test_single_image_paths() {
    PathSemantics s;
    bool ok = check(resolve("/var/www/images/banner.png", s), "resolves flat path");
    ok &= check(!s.wrapper_class.has_value(), "filename is never a class");
    ok &= check(!s.is_responsive, "no pc segment");
    ok &= check(s.sub_directory.empty(), "no sub directory");
    ok &= check(s.relative_base_path == "./images", "base is images");

    ok &= check(resolve("/var/www/images/campaign/fv/top.webp", s), "resolves nested flat path");
    ok &= check(s.wrapper_class == std::optional<std::string>("campaign"), "first directory is the class");
    ok &= check(s.sub_directory == "campaign/fv", "sub directory keeps every level");
    ok &= check(s.is_first_view, "fv segment detected");
    ok &= check(s.output_extension == OutputExtension::jpg, "other formats normalize to jpg");

    ok &= check(resolve("images/pc/banner.PNG", s), "resolves pc without class");
    ok &= check(!s.wrapper_class.has_value(), "no directory after pc means no class");
    ok &= check(s.output_extension == OutputExtension::png, "extension compared case-insensitively");
    return ok;
}

bool test_first_view_is_case_sensitive() {
    PathSemantics s;
    bool ok = check(resolve("images/FV/pc/a.jpg", s), "resolves FV path");
    ok &= check(s.is_first_view, "FV detected");
    ok &= check(resolve("images/Fv/a.jpg", s), "resolves Fv path");
    ok &= check(!s.is_first_view, "mixed case is not first view");
    ok &= check(resolve("images/fvx/a.jpg", s), "resolves fvx path");
    ok &= check(!s.is_first_view, "segment must match exactly");
    return ok;
}

bool test_missing_images_segment() {
    PathSemantics s;
    Error error;
    bool ok = check(!resolve_path_semantics("/srv/assets/pc/banner.png", s, error), "no images directory fails");
    ok &= check(error.kind == ErrorKind::invalid_path_kind, "reported as invalid path kind");

    Error named_error;
    ok &= check(!resolve_path_semantics("/srv/images.png", s, named_error), "filename named images does not count");
    ok &= check(named_error.kind == ErrorKind::invalid_path_kind, "still invalid path kind");
    return ok;
}

bool test_pc_above_images_is_ignored() {
    PathSemantics s;
    bool ok = check(resolve("/home/pc/site/images/top/a.jpg", s), "resolves path with pc above images");
    ok &= check(!s.is_responsive, "pc above images does not make it responsive");
    ok &= check(!sp_counterpart_path("/home/pc/site/images/top/a.jpg").has_value(), "no sp counterpart either");
    return ok;
}

bool test_sp_counterpart_path() {
    auto sp = sp_counterpart_path("/srv/images/widget/pc/hero/banner.jpg");
    bool ok = check(sp.has_value(), "responsive path has a counterpart");
    ok &= check(sp && *sp == fs::path("/srv/images/widget/sp/hero/banner.jpg"), "pc swapped for sp");

    sp = sp_counterpart_path("images/pc/pc/banner.jpg");
    ok &= check(sp && *sp == fs::path("images/sp/pc/banner.jpg"), "only the first pc below images is swapped");

    ok &= check(!sp_counterpart_path("images/widget/banner.jpg").has_value(), "no pc, no counterpart");
    return ok;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_wrapper_before_pc();
    ok &= test_wrapper_after_pc();
    ok &= test_single_image_paths();
    ok &= test_first_view_is_case_sensitive();
    ok &= test_missing_images_segment();
    ok &= test_pc_above_images_is_ignored();
    ok &= test_sp_counterpart_path();
    return ok ? 0 : 1;
}
