#include "ui/main_screen.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <mutex>

using namespace ftxui;

struct MainScreen::Impl {
    Callbacks callbacks;
    std::mutex mutex;
    std::string current = "?";
    std::string latest;
    std::string tree;
    std::string prompt;
    bool restart_available = false;

    Component content = Renderer([] { return text("Loading..."); });
    Component status_bar = Renderer([] { return text(""); });

    // Custom component: handles global shortcuts AFTER child gets first chance.
    class ScreenComponent : public ComponentBase {
    public:
        explicit ScreenComponent(Impl* impl) : impl_(impl) {}

        bool Focusable() const override {
            for (auto& child : children_) {
                if (child->Focusable()) return true;
            }
            return false;
        }

        Element OnRender() override {
            std::string current, latest, tree, prompt;
            bool restart_available;
            {
                std::lock_guard<std::mutex> lock(impl_->mutex);
                current = impl_->current;
                latest = impl_->latest;
                tree = impl_->tree;
                prompt = impl_->prompt;
                restart_available = impl_->restart_available;
            }

            auto header = hbox({
                text(" pubsub-updater ") | bold | color(Color::Cyan),
                separator(),
                text(" " + tree + " ") | dim,
                filler(),
                text(" installed ") | dim,
                text(current + " ") | bold,
                latest.empty()
                    ? text("")
                    : text(" latest " + latest + " ") | color(latest != current ? Color::Yellow : Color::Green),
            });

            Elements footer_items = {
                text(" [C]") | bold, text("heck"),
                text("  [U]") | bold, text("pdate"),
                text("  [X]") | bold, text(" cancel"),
            };
            if (restart_available) {
                footer_items.push_back(text("  [R]") | bold | color(Color::Green));
                footer_items.push_back(text("estart") | color(Color::Green));
            }
            footer_items.push_back(text("  [Q]") | bold);
            footer_items.push_back(text("uit  "));
            auto footer = hbox(std::move(footer_items)) | dim;

            Elements rows = {
                header,
                separator(),
                impl_->content->Render() | flex,
            };
            if (!prompt.empty()) {
                rows.push_back(hbox({text(" " + prompt + " [y/n] ") | bold | color(Color::Yellow), filler()}));
            }
            rows.push_back(separator());
            rows.push_back(impl_->status_bar->Render());
            rows.push_back(footer);
            return vbox(std::move(rows));
        }

        bool OnEvent(Event event) override {
            bool prompting;
            bool restart_available;
            {
                std::lock_guard<std::mutex> lock(impl_->mutex);
                prompting = !impl_->prompt.empty();
                restart_available = impl_->restart_available;
            }

            // Phase 1: a pending confirmation swallows everything but y/n/Esc
            if (prompting) {
                if (event.is_character()) {
                    auto ch = event.character();
                    if (ch == "y" || ch == "Y" || ch == "n" || ch == "N") {
                        if (impl_->callbacks.on_confirm) impl_->callbacks.on_confirm(ch == "y" || ch == "Y");
                    }
                    return true;
                }
                if (event == Event::Escape) {
                    if (impl_->callbacks.on_confirm) impl_->callbacks.on_confirm(false);
                    return true;
                }
                return false;
            }

            // Phase 2: Let child components (the log panel) handle first
            if (ComponentBase::OnEvent(event)) {
                return true;
            }

            // Phase 3: Fallback global shortcuts
            if (event.is_character()) {
                auto ch = event.character();
                if (ch == "q" || ch == "Q") {
                    if (impl_->callbacks.on_quit) impl_->callbacks.on_quit();
                    return true;
                }
                if (ch == "c" || ch == "C") {
                    if (impl_->callbacks.on_check) impl_->callbacks.on_check();
                    return true;
                }
                if (ch == "u" || ch == "U") {
                    if (impl_->callbacks.on_update) impl_->callbacks.on_update();
                    return true;
                }
                if (ch == "x" || ch == "X") {
                    if (impl_->callbacks.on_cancel) impl_->callbacks.on_cancel();
                    return true;
                }
                if ((ch == "r" || ch == "R") && restart_available) {
                    if (impl_->callbacks.on_restart) impl_->callbacks.on_restart();
                    return true;
                }
            }
            return false;
        }

    private:
        Impl* impl_;
    };
};

MainScreen::MainScreen() : impl_(std::make_unique<Impl>()) {}
MainScreen::~MainScreen() = default;

void MainScreen::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

void MainScreen::set_versions(const std::string& current, const std::string& latest) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->current = current.empty() ? "?" : current;
    impl_->latest = latest;
}

void MainScreen::set_tree(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->tree = path;
}

void MainScreen::set_prompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->prompt = prompt;
}

void MainScreen::set_restart_available(bool available) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->restart_available = available;
}

void MainScreen::set_content(Component content) { impl_->content = std::move(content); }
void MainScreen::set_status_bar(Component status_bar) { impl_->status_bar = std::move(status_bar); }

Component MainScreen::component() {
    auto comp = Make<Impl::ScreenComponent>(impl_.get());
    comp->Add(impl_->content);
    return comp;
}
